// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "../UnitTestHelper.h"
#include "../../BinLayout/BinLayout.h"
#include "catch2/catch_test_macros.hpp"
#include <new>
#include <typeinfo>
#include <stdexcept>

using namespace BinLayout;

namespace UnitTests
{
    struct Message
    {
        enum class Kind { Zero, Two, Any };
        Kind _kind = Kind::Zero;
        uint16_t _a = 0, _b = 0;
        uint8_t _anyValue = 0;

        static Message ReadTwo(IInputStream& stream, const Context& ctx)
        {
            RecordReader reader(stream, ctx, "Two");
            reader.Magic(uint8_t(2));
            Message result;
            result._kind = Kind::Two;
            result._a = reader.Field<uint16_t>("a");
            result._b = reader.Field<uint16_t>("b");
            return result;
        }

        static Message ReadAny(IInputStream& stream, const Context& ctx)
        {
            RecordReader reader(stream, ctx, "Any");
            Message result;
            result._kind = Kind::Any;
            result._anyValue = reader.Field<uint8_t>("value");
            return result;
        }

        static Message Read(IInputStream& stream, const Context& ctx, VariantErrorMode mode, bool withCatchAll)
        {
            VariantResolver<Message> resolver(stream, ctx, mode);
            resolver
                .UnitCandidate("Zero", uint8_t(0), Message{})
                .Candidate("Two", &Message::ReadTwo);
            if (withCatchAll)
                resolver.Candidate("Any", &Message::ReadAny);
            return resolver.Finish();
        }
    };

    struct Circle
    {
        uint8_t _radius;
        static const char* CandidateName() { return "Circle"; }

        using ReadArgs = NoArgs;
        static Circle Read(IInputStream& stream, const Context& ctx, const NoArgs&)
        {
            RecordReader reader(stream, ctx, "Circle");
            reader.Magic(char('C'));
            return Circle{ reader.Field<uint8_t>("radius") };
        }
    };

    struct Rectangle
    {
        uint8_t _width, _height;
        static const char* CandidateName() { return "Rectangle"; }

        using ReadArgs = NoArgs;
        static Rectangle Read(IInputStream& stream, const Context& ctx, const NoArgs&)
        {
            RecordReader reader(stream, ctx, "Rectangle");
            reader.Magic(char('R'));
            Rectangle result;
            result._width = reader.Field<uint8_t>("width");
            result._height = reader.Field<uint8_t>("height");
            return result;
        }
    };

        // candidate that is only valid if its pointer can be followed
    struct Indirect
    {
        AbsFilePtr8<uint8_t> _target;
        static const char* CandidateName() { return "Indirect"; }

        using ReadArgs = NoArgs;
        static Indirect Read(IInputStream& stream, const Context& ctx, const NoArgs&)
        {
            RecordReader reader(stream, ctx, "Indirect");
            reader.Magic(char('I'));
            return Indirect{ reader.Field<AbsFilePtr8<uint8_t>>("target") };
        }
        void Resolve(IInputStream& stream, const Context& ctx, const NoArgs&) { ResolveAll(stream, ctx, _target); }
    };

    struct Raw
    {
        uint8_t _value;
        static const char* CandidateName() { return "Raw"; }

        using ReadArgs = NoArgs;
        static Raw Read(IInputStream& stream, const Context& ctx, const NoArgs&)
        {
            RecordReader reader(stream, ctx, "Raw");
            return Raw{ reader.Field<uint8_t>("value") };
        }
    };

    using Shape = std::variant<Circle, Rectangle>;

    TEST_CASE( "BinLayout-VariantOrderAndCommitment", "[binlayout]" )
    {
        const Context ctx{Endian::Big};

        SECTION("Discriminator matches the second candidate")
        {
            auto stream = MakeStream({0x02, 0x00, 0x03, 0x00, 0x04});
            auto msg = Message::Read(stream, ctx, VariantErrorMode::Default, false);
            REQUIRE(msg._kind == Message::Kind::Two);
            REQUIRE(msg._a == 3);
            REQUIRE(msg._b == 4);
            REQUIRE(stream.TellPosition() == 5);
        }

        SECTION("Unit candidate")
        {
            auto stream = MakeStream({0x00, 0x55});
            auto msg = Message::Read(stream, ctx, VariantErrorMode::Default, false);
            REQUIRE(msg._kind == Message::Kind::Zero);
            REQUIRE(stream.TellPosition() == 1);
        }

        SECTION("No candidate matches")
        {
            auto stream = MakeStream({0x01});
            try {
                Message::Read(stream, ctx, VariantErrorMode::Default, false);
                FAIL("Expected an exception");
            } catch (const EnumErrors& e) {
                REQUIRE(e.GetPosition() == 0u);
                auto& attempts = e.GetVariantErrors();
                REQUIRE(attempts.size() == 2);
                REQUIRE(attempts[0]._candidateName == "Zero");
                REQUIRE(attempts[0]._error->GetKind() == ErrorKind::BadMagic);
                REQUIRE(attempts[1]._candidateName == "Two");
                REQUIRE(attempts[1]._error->GetKind() == ErrorKind::BadMagic);
                auto* badMagic = dynamic_cast<const BadMagic*>(attempts[1]._error.get());
                REQUIRE(badMagic);
                REQUIRE(badMagic->GetFound()->RequireCastValue<uint8_t>() == 1);
            }
        }

        SECTION("Catch-all candidate placed last always succeeds")
        {
            auto stream = MakeStream({0x01});
            auto msg = Message::Read(stream, ctx, VariantErrorMode::Default, true);
            REQUIRE(msg._kind == Message::Kind::Any);
            REQUIRE(msg._anyValue == 1);
        }

        SECTION("First successful candidate is committed")
        {
            auto stream = MakeStream({0x02, 0x00, 0x03, 0x00, 0x04});
            auto msg = VariantResolver<Message>(stream, ctx)
                .Candidate("Any", &Message::ReadAny)
                .Candidate("Two", &Message::ReadTwo)
                .Finish();
            REQUIRE(msg._kind == Message::Kind::Any);
            REQUIRE(stream.TellPosition() == 1);
        }
    }

    TEST_CASE( "BinLayout-VariantErrorModes", "[binlayout]" )
    {
        const Context ctx{Endian::Big};

        SECTION("All errors")
        {
                // matches the discriminator for "Two", but there isn't enough data for the fields
            auto stream = MakeStream({0x02, 0x00});
            try {
                Message::Read(stream, ctx, VariantErrorMode::ReturnAllErrors, false);
                FAIL("Expected an exception");
            } catch (const EnumErrors& e) {
                auto& attempts = e.GetVariantErrors();
                REQUIRE(attempts.size() == 2);
                REQUIRE(attempts[0]._error->GetKind() == ErrorKind::BadMagic);
                REQUIRE(attempts[1]._error->GetKind() == ErrorKind::IO);
            }
        }

        SECTION("Default is the same as all errors")
        {
            auto stream = MakeStream({0x02, 0x00});
            REQUIRE_THROWS_AS(Message::Read(stream, ctx, VariantErrorMode::Default, false), EnumErrors);
        }

        SECTION("Reduced detail")
        {
            auto stream = MakeStream({0x07, 0x02, 0x00});
            stream.SeekAbsolute(1);
            try {
                Message::Read(stream, ctx, VariantErrorMode::ReturnUnexpectedError, false);
                FAIL("Expected an exception");
            } catch (const NoVariantMatch& e) {
                REQUIRE(e.GetKind() == ErrorKind::NoVariantMatch);
                REQUIRE(e.GetPosition() == 1u);
            }
        }

        SECTION("Non-read failures are reported as custom errors")
        {
            auto stream = MakeStream({0x02});
            try {
                VariantResolver<int>(stream, ctx)
                    .Candidate("Throws", [](IInputStream&, const Context&) -> int { throw std::runtime_error("client failure"); })
                    .Finish();
                FAIL("Expected an exception");
            } catch (const EnumErrors& e) {
                REQUIRE(e.GetVariantErrors().size() == 1);
                REQUIRE(e.GetVariantErrors()[0]._error->GetKind() == ErrorKind::Custom);
            }
        }
    }

    TEST_CASE( "BinLayout-StdVariant", "[binlayout]" )
    {
        auto rectangle = MakeStream({'R', 0x03, 0x04});
        auto shape = ReadBE<Shape>(rectangle);
        REQUIRE(std::holds_alternative<Rectangle>(shape));
        REQUIRE(std::get<Rectangle>(shape)._width == 3);
        REQUIRE(std::get<Rectangle>(shape)._height == 4);
        REQUIRE(rectangle.TellPosition() == 3);

        auto circle = MakeStream({'C', 0x09});
        REQUIRE(std::get<Circle>(ReadBE<Shape>(circle))._radius == 9);

        auto neither = MakeStream({'T', 0x00, 0x00});
        try {
            ReadBE<Shape>(neither);
            FAIL("Expected an exception");
        } catch (const EnumErrors& e) {
            REQUIRE(e.GetVariantErrors().size() == 2);
            REQUIRE(e.GetVariantErrors()[0]._candidateName == "Circle");
            REQUIRE(e.GetVariantErrors()[1]._candidateName == "Rectangle");
        }

        neither.SeekAbsolute(0);
        auto ctx = Context{Endian::Big}.With<ContextKey::VariantErrors>(VariantErrorMode::ReturnUnexpectedError);
        REQUIRE_THROWS_AS(ReadValueWithContext<Shape>(neither, ctx, NoArgs{}), NoVariantMatch);
    }

    TEST_CASE( "BinLayout-VariantResolvesCandidates", "[binlayout]" )
    {
        using Target = std::variant<Indirect, Raw>;

        SECTION("Pointer can be followed")
        {
            auto stream = MakeStream({'I', 0x02, 0x66});
            auto value = ReadBE<Target>(stream);
            REQUIRE(std::holds_alternative<Indirect>(value));
            REQUIRE(*std::get<Indirect>(value)._target == 0x66);
            REQUIRE(stream.TellPosition() == 2);
        }

        SECTION("Pointer can't be followed, so the next candidate is used")
        {
            auto stream = MakeStream({'I', 0x40});
            auto value = ReadBE<Target>(stream);
            REQUIRE(std::holds_alternative<Raw>(value));
            REQUIRE(std::get<Raw>(value)._value == 'I');
            REQUIRE(stream.TellPosition() == 1);
        }
    }

    TEST_CASE( "BinLayout-VariantContractViolations", "[binlayout]" )
    {
        const Context ctx{Endian::Big};

            // dereferencing a pointer that was never resolved is a programming error; it must
            // not be treated as a rejected candidate, even when a catch-all candidate follows
        auto stream = MakeStream({0x01, 0x07});
        auto unresolvedDeref = [](IInputStream& s, const Context& c) -> int {
            auto ptr = BinLayout::Read<AbsFilePtr8<uint8_t>>(s, c);
            return *ptr;
        };
        auto catchAll = [](IInputStream& s, const Context& c) -> int { return BinLayout::Read<uint8_t>(s, c); };

        REQUIRE_THROWS_AS(
            VariantResolver<int>(stream, ctx)
                .Candidate("Unresolved", unresolvedDeref)
                .Candidate("Any", catchAll)
                .Finish(),
            std::logic_error);

            // same for a missing context key without a default
        struct MissingKey { using ValueType = int; };
        stream.SeekAbsolute(0);
        REQUIRE_THROWS_AS(
            VariantResolver<int>(stream, ctx)
                .Candidate("NeedsKey", [](IInputStream&, const Context& c) -> int { return c.Get<MissingKey>(); })
                .Candidate("Any", catchAll)
                .Finish(),
            std::out_of_range);

        stream.SeekAbsolute(0);
        REQUIRE_THROWS_AS(
            VariantResolver<int>(stream, ctx)
                .Candidate("OutOfMemory", [](IInputStream&, const Context&) -> int { throw std::bad_alloc(); })
                .Candidate("Any", catchAll)
                .Finish(),
            std::bad_alloc);
    }

    TEST_CASE( "BinLayout-VariantCandidateNames", "[binlayout]" )
    {
            // alternatives without CandidateName() are named by typeid
        using CircleOrWord = std::variant<Circle, uint32_t>;
        auto stream = MakeStream({'T'});
        try {
            ReadBE<CircleOrWord>(stream);
            FAIL("Expected an exception");
        } catch (const EnumErrors& e) {
            REQUIRE(e.GetVariantErrors().size() == 2);
            REQUIRE(e.GetVariantErrors()[0]._candidateName == "Circle");
            REQUIRE(e.GetVariantErrors()[1]._candidateName == typeid(uint32_t).name());
            REQUIRE(e.GetVariantErrors()[1]._error->GetKind() == ErrorKind::IO);
        }
    }
}
