// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Log.h"
#include "../Utility/StringFormat.h"
#include "../Core/Exceptions.h"
#include <iostream>
#include <algorithm>

namespace OSServices
{
    OutputStream& MessageTarget::GetStream()
    {
        auto& str = _cfg._outputStream ? *_cfg._outputStream : std::cerr;
        str << "[" << _id << "] ";
        return str;
    }

    MessageTarget::MessageTarget(const char id[], const MessageTargetConfiguration& defaultCfg)
    : _id(id), _cfg(defaultCfg), _defaultCfg(defaultCfg)
    {
        LogCentral::GetInstance()->Register(*this);
    }

    MessageTarget::~MessageTarget()
    {
        LogCentral::GetInstance()->Deregister(*this);
    }

///////////////////////////////////////////////////////////////////////////////////////////////////

    const MessageTargetConfiguration* LogConfigurationSet::TryGet(StringSection<> id) const
    {
        for (const auto& c:_configs)
            if (XlEqStringI(MakeStringSection(c.first), id))
                return &c.second;
        return nullptr;
    }

    void LogConfigurationSet::Set(StringSection<> id, const MessageTargetConfiguration& cfg)
    {
        for (auto& c:_configs)
            if (XlEqStringI(MakeStringSection(c.first), id)) {
                c.second = cfg;
                return;
            }
        _configs.emplace_back(id.AsString(), cfg);
    }

    LogConfigurationSet::LogConfigurationSet() = default;

    LogConfigurationSet::LogConfigurationSet(StringSection<> configText)
    {
        auto i = configText.begin();
        unsigned lineIndex = 0;
        while (i != configText.end()) {
            auto lineEnd = std::find(i, configText.end(), '\n');
            auto line = StripWhitespace({i, lineEnd});
            i = (lineEnd == configText.end()) ? lineEnd : lineEnd+1;
            ++lineIndex;

            if (line.IsEmpty() || *line.begin() == '#') continue;

            auto equals = std::find(line.begin(), line.end(), '=');
            if (equals == line.end())
                Throw(std::runtime_error((StringMeld<256>() << "Expecting Target=value on line " << lineIndex << " of log configuration").AsString()));

            auto id = StripWhitespace({line.begin(), equals});
            auto value = StripWhitespace({equals+1, line.end()});
            MessageTargetConfiguration cfg;
            if (XlEqStringI(value, "enabled") || XlEqStringI(value, "true") || XlEqStringI(value, "1")) {
                cfg._enabled = true;
            } else if (XlEqStringI(value, "disabled") || XlEqStringI(value, "false") || XlEqStringI(value, "0")) {
                cfg._enabled = false;
            } else
                Throw(std::runtime_error((StringMeld<256>() << "Unknown value (" << value.AsString() << ") for target (" << id.AsString() << ") in log configuration").AsString()));
            Set(id, cfg);
        }
    }

    LogConfigurationSet::~LogConfigurationSet() = default;

///////////////////////////////////////////////////////////////////////////////////////////////////

    void LogCentral::Register(MessageTarget& target)
    {
        std::unique_lock<std::mutex> l(_lock);
        _targets.push_back(&target);
        ApplyConfiguration(target);
    }

    void LogCentral::Deregister(MessageTarget& target)
    {
        std::unique_lock<std::mutex> l(_lock);
        auto i = std::find(_targets.begin(), _targets.end(), &target);
        if (i != _targets.end())
            _targets.erase(i);
    }

    void LogCentral::SetConfiguration(std::shared_ptr<LogConfigurationSet> cfgs)
    {
        std::unique_lock<std::mutex> l(_lock);
        _cfgSet = std::move(cfgs);
        for (auto* t:_targets)
            ApplyConfiguration(*t);
    }

    void LogCentral::ApplyConfiguration(MessageTarget& target)
    {
        const MessageTargetConfiguration* cfg = nullptr;
        if (_cfgSet)
            cfg = _cfgSet->TryGet(target.GetId());
        target.SetConfiguration(cfg ? *cfg : target.GetDefaultConfiguration());
    }

    const std::shared_ptr<LogCentral>& LogCentral::GetInstance()
    {
        static std::shared_ptr<LogCentral> s_instance = std::make_shared<LogCentral>();
        return s_instance;
    }

    LogCentral::LogCentral() = default;
    LogCentral::~LogCentral() = default;

///////////////////////////////////////////////////////////////////////////////////////////////////

    static MessageTargetConfiguration MakeDefaultConfiguration(bool enabled)
    {
        MessageTargetConfiguration result;
        result._enabled = enabled;
        return result;
    }

    MessageTarget Debug("Debug", MakeDefaultConfiguration(false));
    MessageTarget Verbose("Verbose", MakeDefaultConfiguration(false));
    MessageTarget Warning("Warning", MakeDefaultConfiguration(true));
    MessageTarget Error("Error", MakeDefaultConfiguration(true));
}
