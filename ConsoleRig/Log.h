// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Utility/StringUtils.h"
#include "../Utility/Streams/StreamFormatter.h"
#include <string>
#include <vector>
#include <ostream>
#include <memory>
#include <functional>

#if defined(_DEBUG) || defined(NODECODEGEN_ENABLE_LOG)
    #define CONSOLERIG_ENABLE_LOG
#endif

namespace ConsoleRig
{
    class SourceLocation
    {
    public:
        const char*     _file = nullptr;
        unsigned        _line = ~0u;
        const char*     _function = nullptr;
    };

    class MessageTargetConfiguration
    {
    public:
        std::string _template;
        struct Sink
        {
            enum Enum { Console = 1<<0 };
            using BitField = unsigned;
        };
        Sink::BitField _enabledSinks = Sink::Console;
        Sink::BitField _disabledSinks = 0;
    };

    template<typename CharType = char, typename CharTraits = std::char_traits<CharType>>
        class MessageTarget : public std::basic_streambuf<CharType, CharTraits>
    {
    public:
        using OutputFn = std::function<std::streamsize(const CharType*, std::streamsize)>;

        void SetNextSourceLocation(const SourceLocation& sourceLocation) { _pendingSourceLocation = sourceLocation; _sourceLocationPrimed = true; }
        void SetConfiguration(const MessageTargetConfiguration& cfg) { _cfg = cfg; }
        const MessageTargetConfiguration& GetConfiguration() const { return _cfg; }
        void SetExternalMessageHandler(OutputFn externalMessageHandler) { _externalMessageHandler = std::move(externalMessageHandler); }

        MessageTarget(
            StringSection<> id, 
            const MessageTargetConfiguration& initialCfg = {},
            std::basic_streambuf<CharType, CharTraits>& chain = DefaultChain());
        ~MessageTarget();

        MessageTarget(const MessageTarget&) = delete;
        MessageTarget& operator=(const MessageTarget&) = delete;

        static std::basic_streambuf<CharType, CharTraits>& DefaultChain();
    private:
        std::basic_streambuf<CharType, CharTraits>* _chain;
        SourceLocation              _pendingSourceLocation;
        bool                        _sourceLocationPrimed = false;
        MessageTargetConfiguration  _cfg;
        OutputFn                    _externalMessageHandler;

        using int_type = typename std::basic_streambuf<CharType, CharTraits>::int_type;
        virtual std::streamsize xsputn(const CharType* s, std::streamsize count) override;
        virtual int_type overflow(int_type ch) override;
        virtual int sync() override;

        OutputFn GetOutputFn() const;
        std::streamsize FormatAndOutput(
            StringSection<CharType> msg,
            const std::string& fmtTemplate,
            const SourceLocation& sourceLocation);
    };

    /// <summary>Configuration settings for a set of message targets</summary>
    /// Loaded from the indentation based text format. Each top level element names a message
    /// target and may contain "OutputToConsole", "Template" and an "Inherit" list:
    /// <code>\code
    ///     Warning =~
    ///         OutputToConsole = true
    ///         Template = <:([{file}:{line}]):>
    ///     Verbose =~
    ///         Inherit =~
    ///             = Warning
    ///         OutputToConsole = false
    /// \endcode</code>
    /// Can be shared between multiple different modules.
    class LogConfigurationSet
    {
    public:
        MessageTargetConfiguration ResolveConfig(StringSection<> name) const;
        void Set(StringSection<> id, const MessageTargetConfiguration& cfg);

        LogConfigurationSet();
        LogConfigurationSet(InputStreamFormatter<utf8>& formatter);
        ~LogConfigurationSet();
    private:
        class Config
        {
        public:
            std::vector<std::string> _inherit;
            MessageTargetConfiguration _cfg;
        };

        std::vector<std::pair<std::string, Config>> _configs;

        Config LoadConfig(InputStreamFormatter<utf8>& formatter);
    };

    /// <summary>Manages all message targets for a module</summary>
    /// LogCentral holds a list of all active logging message targets for a given current module.
    /// This list is used when we want to apply a configuration set.
    /// We separate the management of the message targets from the management of the configuration
    /// because we want to be able to use the message targets before the configuration has been
    /// loaded (ie, during early stages of initialization).
    class LogCentral
    {
    public:
        static LogCentral& GetInstance();

        void Register(MessageTarget<>& target, StringSection<> id);
        void Deregister(MessageTarget<>& target);

        void SetConfiguration(const std::shared_ptr<LogConfigurationSet>& cfgs);

        LogCentral();
        ~LogCentral();
        LogCentral& operator=(const LogCentral&) = delete;
        LogCentral(const LogCentral&) = delete;
    private:
        class Pimpl;
        std::unique_ptr<Pimpl> _pimpl;
    };

    std::shared_ptr<LogConfigurationSet> LoadLogConfigurationSet(StringSection<utf8> text);

////////////////////////////////////////////////////////////////////////////////////////////////////

    template<typename CharType, typename CharTraits>
        MessageTarget<CharType, CharTraits>::MessageTarget(
            StringSection<> id, 
            const MessageTargetConfiguration& initialCfg,
            std::basic_streambuf<CharType, CharTraits>& chain)
    : _chain(&chain), _cfg(initialCfg)
    {
        #if defined(CONSOLERIG_ENABLE_LOG)
            LogCentral::GetInstance().Register(*this, id);
        #endif
    }

    template<typename CharType, typename CharTraits>
        MessageTarget<CharType, CharTraits>::~MessageTarget()
    {
        _chain->pubsync();
        #if defined(CONSOLERIG_ENABLE_LOG)
            LogCentral::GetInstance().Deregister(*this);
        #endif
    }

////////////////////////////////////////////////////////////////////////////////////////////////////

    template<typename CharType>
        std::basic_ostream<CharType>& operator<<(std::basic_ostream<CharType>& ostream, const SourceLocation& sourceLocation)
    {
        auto* rdbuf = ostream.rdbuf();
        ((MessageTarget<CharType>*)rdbuf)->SetNextSourceLocation(sourceLocation);
        return ostream;
    }

    namespace Internal
    {
        constexpr const char* JustFilename(const char filePath[])
        {
            const char* pastLastSlash = filePath;
            for (const auto* i=filePath; *i; ++i)
                if (*i == '\\' || *i == '/') pastLastSlash = i+1;
            return pastLastSlash;
        }
    }

#if defined(CONSOLERIG_ENABLE_LOG)
    #define MakeSourceLocation (::ConsoleRig::SourceLocation {::ConsoleRig::Internal::JustFilename(__FILE__), __LINE__, __FUNCTION__})
    #define Log(X) ::std::basic_ostream<typename std::remove_reference<decltype(X)>::type::char_type, typename std::remove_reference<decltype(X)>::type::traits_type>(&X) << MakeSourceLocation
#else
    // we need to disable the warning "dangling-else" for this construct
    //      unfortunately, it has to be done globally because this evaluates to a macro
    #pragma GCC diagnostic ignored "-Wdangling-else"
    extern std::ostream* g_fakeOStream;
    #define Log(X) if (true) {} else (*::ConsoleRig::g_fakeOStream)
#endif

}

extern ConsoleRig::MessageTarget<> Error;
extern ConsoleRig::MessageTarget<> Warning;
extern ConsoleRig::MessageTarget<> Debug;
extern ConsoleRig::MessageTarget<> Verbose;
