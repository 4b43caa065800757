// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Log.h"
#include "../Utility/IteratorUtils.h"
#include "../Utility/Streams/StreamFormatter.h"
#include "../Utility/Threading/Mutex.h"
#include <fmt/format.h>
#include <iostream>
#include <algorithm>

namespace ConsoleRig
{
    template<typename CharType, typename CharTraits>
        auto MessageTarget<CharType, CharTraits>::GetOutputFn() const -> OutputFn
    {
        if (_externalMessageHandler) return _externalMessageHandler;
        auto* chain = _chain;
        return [chain](const CharType* s, std::streamsize count) -> std::streamsize {
            return chain->sputn(s, count);
        };
    }

    template<typename CharType, typename CharTraits>
        std::streamsize MessageTarget<CharType, CharTraits>::FormatAndOutput(
            StringSection<CharType> msg,
            const std::string& fmtTemplate,
            const SourceLocation& sourceLocation)
    {
        auto outputFn = GetOutputFn();
		if (!fmtTemplate.empty()) {
            auto fmt = fmt::format(
                fmt::runtime(fmtTemplate),
                fmt::arg("file", sourceLocation._file ? sourceLocation._file : ""),
                fmt::arg("line", sourceLocation._line));
            outputFn(fmt.data(), fmt.size());
            outputFn(" ", 1); // always append one extra space since the format string can't
        }
        return outputFn(msg.begin(), msg.size());       // (note; don't include the length of the formatted section; because it will confuse the caller when it is a basic_ostream
    }

    template<typename CharType, typename CharTraits>
        std::streamsize MessageTarget<CharType, CharTraits>::xsputn(const CharType* s, std::streamsize count)
    {
        if ((_cfg._enabledSinks & ~_cfg._disabledSinks) & MessageTargetConfiguration::Sink::Console) {
            auto result = FormatAndOutput(
                MakeStringSection(s, s + count),
                _sourceLocationPrimed ? _cfg._template : std::string(),
                _pendingSourceLocation);
            _sourceLocationPrimed = false;
            return result;
        } else {
            return count;       // swallowed by a disabled target
        }
    }

    template<typename CharType, typename CharTraits>
        auto MessageTarget<CharType, CharTraits>::overflow(int_type ch) -> int_type
    {
        using Traits = typename std::basic_streambuf<CharType, CharTraits>::traits_type;
        if (!Traits::eq_int_type(ch, Traits::eof())) {
            if ((_cfg._enabledSinks & ~_cfg._disabledSinks) & MessageTargetConfiguration::Sink::Console) {
                auto c = Traits::to_char_type(ch);
                GetOutputFn()(&c, 1);
            }
            return Traits::not_eof(ch);
        }

        return std::basic_streambuf<CharType, CharTraits>::overflow(ch);
    }

    template<typename CharType, typename CharTraits>
        int MessageTarget<CharType, CharTraits>::sync() 
		{ 
			return _chain->pubsync(); 
		}

    template<>
        std::basic_streambuf<char>& MessageTarget<char>::DefaultChain()
    {
        return *std::cout.rdbuf();
    }

    template class MessageTarget<>;

////////////////////////////////////////////////////////////////////////////////////////////////////

    static void MergeIn(MessageTargetConfiguration& dst, const MessageTargetConfiguration& src)
    {
        if (!src._template.empty())
            dst._template = src._template;
        dst._enabledSinks |= src._enabledSinks;
        dst._enabledSinks &= ~src._disabledSinks;
    }

    MessageTargetConfiguration LogConfigurationSet::ResolveConfig(StringSection<> name) const
    {
        MessageTargetConfiguration result;
        auto i = std::find_if(_configs.begin(), _configs.end(),
            [name](const std::pair<std::string, Config>&p) { return XlEqString(MakeStringSection(p.first), name); });
        if (i == _configs.end()) return result;

        const auto& src = i->second;
        for (const auto&inherit:src._inherit)
            if (!XlEqString(MakeStringSection(inherit), name))
                MergeIn(result, ResolveConfig(inherit));
        MergeIn(result, src._cfg);
        return result;
    }

    void LogConfigurationSet::Set(StringSection<> id, const MessageTargetConfiguration& cfg)
    {
        auto str = id.AsString();
        auto existing = std::find_if(
            _configs.begin(), _configs.end(),
            [str](const std::pair<std::string, Config>& p) { return p.first == str; });
        if (existing != _configs.end()) {
            existing->second = {{}, cfg};
        } else {
            _configs.emplace_back(std::make_pair(str, Config{{}, cfg}));
        }
    }

    LogConfigurationSet::LogConfigurationSet() {}
    LogConfigurationSet::LogConfigurationSet(InputStreamFormatter<utf8>& formatter)
    {
        for (;;) {
            using Blob = InputStreamFormatter<utf8>::Blob;
            switch (formatter.PeekNext()) {
            case Blob::KeyedItem:
                {
                    InputStreamFormatter<utf8>::InteriorSection eleName;
                    formatter.TryKeyedItem(eleName);
                    if (formatter.PeekNext() != Blob::BeginElement) {
                        SkipValueOrElement(formatter);
                        break;
                    }

                    RequireBeginElement(formatter);
                    auto cfg = LoadConfig(formatter);
                    _configs.emplace_back(std::make_pair(eleName.AsString(), std::move(cfg)));
                    RequireEndElement(formatter);
                    break;
                }

            case Blob::Value:
            case Blob::BeginElement:
                Throw(FormatException("Expecting a named message target configuration", formatter.GetLocation()));

            case Blob::EndElement:
            case Blob::None:
                return;
            }
        }
    }

    static bool ParseBool(StringSection<utf8> value, StreamLocation location)
    {
        if (XlEqStringI(value, "true") || XlEqString(value, "1")) return true;
        if (XlEqStringI(value, "false") || XlEqString(value, "0")) return false;
        Throw(FormatException("Expecting boolean value", location));
    }

    auto LogConfigurationSet::LoadConfig(InputStreamFormatter<utf8>& formatter) -> Config
    {
        Config cfg;
        for (;;) {
            StringSection<utf8> name;
            if (!formatter.TryKeyedItem(name)) break;

            if (XlEqString(name, "OutputToConsole")) {
                bool outputToConsole = ParseBool(RequireValue(formatter), formatter.GetLocation());
                cfg._cfg._enabledSinks = (outputToConsole ? MessageTargetConfiguration::Sink::Console : 0u);
                cfg._cfg._disabledSinks = ((!outputToConsole) ? MessageTargetConfiguration::Sink::Console : 0u);
            } else if (XlEqString(name, "Template")) {
                cfg._cfg._template = RequireValue(formatter).AsString();
            } else if (XlEqString(name, "Inherit")) {
                RequireBeginElement(formatter);
                StringSection<utf8> inherit;
                while (formatter.TryValue(inherit))
                    cfg._inherit.push_back(inherit.AsString());
                RequireEndElement(formatter);
            } else {
                SkipValueOrElement(formatter);
            }
        }

        return cfg;
    }

    LogConfigurationSet::~LogConfigurationSet() {}

    std::shared_ptr<LogConfigurationSet> LoadLogConfigurationSet(StringSection<utf8> text)
    {
        InputStreamFormatter<utf8> fmtr{TextStreamMarker<utf8>{text}};
        return std::make_shared<LogConfigurationSet>(fmtr);
    }

////////////////////////////////////////////////////////////////////////////////////////////////////

    class LogCentral::Pimpl
    {
    public:
        struct Target
        {
            std::string _id;
            MessageTarget<>* _target;
        };
        std::vector<Target> _activeTargets;
        std::shared_ptr<LogConfigurationSet> _activeCfgSet;
        Threading::Mutex _lock;
    };
    
    LogCentral& LogCentral::GetInstance()
    {
        static LogCentral s_instance;
        return s_instance;
    }

    void LogCentral::Register(MessageTarget<>& target, StringSection<> id)
    {
        assert(!id.IsEmpty());      // empty id's are not supported -- without the id, there's no way to assign a configuration

        ScopedLock(_pimpl->_lock);
        
        // If you hit the following assert, it means there are 2 message targets with the same name
        // This could happen if a target is copied from one place to another, or if it's defined in
        // a header, instead of a source file.
        assert(std::find_if(_pimpl->_activeTargets.begin(), _pimpl->_activeTargets.end(),
            [id](const Pimpl::Target& t) { return XlEqString(MakeStringSection(t._id), id); }) == _pimpl->_activeTargets.end());

        _pimpl->_activeTargets.push_back(Pimpl::Target{id.AsString(), &target});

        // Set the initial configuration
        if (_pimpl->_activeCfgSet)
            target.SetConfiguration(_pimpl->_activeCfgSet->ResolveConfig(id));
    }

    void LogCentral::Deregister(MessageTarget<>& target)
    {
        ScopedLock(_pimpl->_lock);
        auto i = std::find_if(_pimpl->_activeTargets.begin(), _pimpl->_activeTargets.end(),
            [&target](const Pimpl::Target& t) { return t._target == &target; });
        if (i!=_pimpl->_activeTargets.end())
            _pimpl->_activeTargets.erase(i);
    }

    void LogCentral::SetConfiguration(const std::shared_ptr<LogConfigurationSet>& cfgs)
    {
        ScopedLock(_pimpl->_lock);
        _pimpl->_activeCfgSet = cfgs;
        if (cfgs) {
            for (const auto&t:_pimpl->_activeTargets)
                t._target->SetConfiguration(cfgs->ResolveConfig(t._id));
        } else {
            for (const auto&t:_pimpl->_activeTargets)
                t._target->SetConfiguration(
                    XlEqString(MakeStringSection(t._id), "Verbose")
                        ? MessageTargetConfiguration{ std::string(), 0, MessageTargetConfiguration::Sink::Console }
                        : MessageTargetConfiguration{});
        }
    }

    LogCentral::LogCentral()
    {
        _pimpl = std::make_unique<Pimpl>();
        // We can't load the config set here, because we will frequently get here during static initialization
    }

    LogCentral::~LogCentral() 
    {
    }

    std::ostream* g_fakeOStream = nullptr;
}

ConsoleRig::MessageTarget<> Error("Error");
ConsoleRig::MessageTarget<> Warning("Warning");
ConsoleRig::MessageTarget<> Debug("Debug");
ConsoleRig::MessageTarget<> Verbose("Verbose", ConsoleRig::MessageTargetConfiguration{ std::string(), 0, ConsoleRig::MessageTargetConfiguration::Sink::Console });
