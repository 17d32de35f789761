// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include <string>
#include <memory>

namespace OSServices { class LogConfigurationSet; }

namespace ConsoleRig
{
    class StartupConfig
    {
    public:
        std::string _applicationName;
        std::string _logConfigFile;         ///< optional; missing files are reported and ignored
        std::string _logConfig;             ///< inline configuration, applied on top of _logConfigFile

        StartupConfig();
        StartupConfig(const char applicationName[]);
    };

    /// <summary>Process wide services, configured once at startup</summary>
    /// Only one instance may exist at a time. Construction applies the logging
    /// configuration from the StartupConfig; destruction reverts it.
    class GlobalServices
    {
    public:
        const StartupConfig& GetStartupConfig() const;
        const std::shared_ptr<OSServices::LogConfigurationSet>& GetLogConfiguration() const;

        static GlobalServices& GetInstance();
        static bool HasInstance() { return s_instance != nullptr; }

        GlobalServices(const StartupConfig& cfg = StartupConfig());
        ~GlobalServices();

        GlobalServices(const GlobalServices&) = delete;
        GlobalServices& operator=(const GlobalServices&) = delete;
    protected:
        static GlobalServices* s_instance;

        class Pimpl;
        std::unique_ptr<Pimpl> _pimpl;
    };

    std::shared_ptr<GlobalServices> MakeGlobalServices(const StartupConfig& cfg);
}
