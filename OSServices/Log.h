// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Utility/StringUtils.h"
#include "../Utility/Streams/Stream.h"
#include <memory>
#include <vector>
#include <string>
#include <mutex>

namespace OSServices
{
    class MessageTargetConfiguration
    {
    public:
        bool _enabled = true;
        OutputStream* _outputStream = nullptr;      ///< when null, messages go to std::cerr
    };

    /// <summary>Named configurations for message targets</summary>
    /// Parsed from a simple line based text format:
    /// <code>
    ///     # comment
    ///     Verbose=enabled
    ///     Debug=disabled
    /// </code>
    /// Target names are matched case insensitively.
    class LogConfigurationSet
    {
    public:
        const MessageTargetConfiguration* TryGet(StringSection<> id) const;
        void Set(StringSection<> id, const MessageTargetConfiguration& cfg);

        LogConfigurationSet();
        LogConfigurationSet(StringSection<> configText);
        ~LogConfigurationSet();
    private:
        std::vector<std::pair<std::string, MessageTargetConfiguration>> _configs;
    };

    /// <summary>A destination for log messages, such as "Warning" or "Verbose"</summary>
    /// Don't use directly; write messages with the Log() macro:
    /// <code>
    ///     Log(Warning) << "Something unexpected happened" << std::endl;
    /// </code>
    class MessageTarget
    {
    public:
        bool IsEnabled() const { return _cfg._enabled; }
        OutputStream& GetStream();
        StringSection<> GetId() const { return _id; }
        void SetConfiguration(const MessageTargetConfiguration& cfg) { _cfg = cfg; }
        const MessageTargetConfiguration& GetDefaultConfiguration() const { return _defaultCfg; }

        MessageTarget(const char id[], const MessageTargetConfiguration& defaultCfg);
        ~MessageTarget();
        MessageTarget(const MessageTarget&) = delete;
        MessageTarget& operator=(const MessageTarget&) = delete;
    private:
        std::string _id;
        MessageTargetConfiguration _cfg;
        MessageTargetConfiguration _defaultCfg;
    };

    class LogCentral
    {
    public:
        void Register(MessageTarget& target);
        void Deregister(MessageTarget& target);

        /// <summary>Apply a configuration set to all registered targets</summary>
        /// Targets not mentioned in the set revert to their default configuration.
        /// Pass nullptr to revert everything.
        void SetConfiguration(std::shared_ptr<LogConfigurationSet> cfgs);
        const std::shared_ptr<LogConfigurationSet>& GetConfiguration() const { return _cfgSet; }

        static const std::shared_ptr<LogCentral>& GetInstance();

        LogCentral();
        ~LogCentral();
    private:
        std::mutex _lock;
        std::vector<MessageTarget*> _targets;
        std::shared_ptr<LogConfigurationSet> _cfgSet;

        void ApplyConfiguration(MessageTarget& target);
    };

    extern MessageTarget Debug;
    extern MessageTarget Verbose;
    extern MessageTarget Warning;
    extern MessageTarget Error;
}

#define Log(X) if (!::OSServices::X.IsEnabled()) {} else ::OSServices::X.GetStream()
