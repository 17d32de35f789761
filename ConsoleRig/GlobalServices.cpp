// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "GlobalServices.h"
#include "../OSServices/Log.h"
#include "../Utility/StringUtils.h"
#include "../Core/Exceptions.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ConsoleRig
{
    static std::shared_ptr<OSServices::LogConfigurationSet> LoadConfigSet(const StartupConfig& cfg)
    {
        auto result = std::make_shared<OSServices::LogConfigurationSet>();

        if (!cfg._logConfigFile.empty()) {
            std::ifstream file(cfg._logConfigFile, std::ios::in | std::ios::binary);
            if (file.is_open()) {
                std::stringstream contents;
                contents << file.rdbuf();
                auto text = contents.str();
                result = std::make_shared<OSServices::LogConfigurationSet>(MakeStringSection(text));
            } else {
                Log(Warning) << "Could not open log configuration file (" << cfg._logConfigFile << "). Using default log configuration" << std::endl;
            }
        }

        if (!cfg._logConfig.empty()) {
                // inline settings override anything from the file
            OSServices::LogConfigurationSet inlineSet(MakeStringSection(cfg._logConfig));
            for (const char* id:{"Debug", "Verbose", "Warning", "Error"})
                if (auto* c = inlineSet.TryGet(id))
                    result->Set(id, *c);
        }

        return result;
    }

///////////////////////////////////////////////////////////////////////////////////////////////////

    class GlobalServices::Pimpl
    {
    public:
        StartupConfig _cfg;
        std::shared_ptr<OSServices::LogConfigurationSet> _logCfg;
    };

    const StartupConfig& GlobalServices::GetStartupConfig() const { return _pimpl->_cfg; }
    const std::shared_ptr<OSServices::LogConfigurationSet>& GlobalServices::GetLogConfiguration() const { return _pimpl->_logCfg; }

    GlobalServices& GlobalServices::GetInstance()
    {
        if (!s_instance)
            Throw(std::logic_error("GlobalServices::GetInstance() called before GlobalServices was constructed"));
        return *s_instance;
    }

    GlobalServices* GlobalServices::s_instance = nullptr;

    GlobalServices::GlobalServices(const StartupConfig& cfg)
    {
        if (s_instance)
            Throw(std::logic_error("Attempting to construct a second GlobalServices instance"));

        _pimpl = std::make_unique<Pimpl>();
        _pimpl->_cfg = cfg;
        _pimpl->_logCfg = LoadConfigSet(cfg);
        OSServices::LogCentral::GetInstance()->SetConfiguration(_pimpl->_logCfg);
        s_instance = this;

        Log(Verbose) << "Started global services for application (" << cfg._applicationName << ")" << std::endl;
    }

    GlobalServices::~GlobalServices()
    {
        OSServices::LogCentral::GetInstance()->SetConfiguration(nullptr);
        if (s_instance == this)
            s_instance = nullptr;
    }

    std::shared_ptr<GlobalServices> MakeGlobalServices(const StartupConfig& cfg)
    {
        return std::make_shared<GlobalServices>(cfg);
    }

///////////////////////////////////////////////////////////////////////////////////////////////////

    StartupConfig::StartupConfig()
    {
        _applicationName = "BinLayout";
    }

    StartupConfig::StartupConfig(const char applicationName[]) : StartupConfig()
    {
        _applicationName = applicationName;
    }
}
