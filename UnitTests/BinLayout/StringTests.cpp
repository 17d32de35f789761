// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "../UnitTestHelper.h"
#include "../../BinLayout/BinLayout.h"
#include "catch2/catch_test_macros.hpp"

using namespace BinLayout;

namespace UnitTests
{
    struct NamedEntry
    {
        NullString _name;
        uint16_t _id;

        using ReadArgs = NoArgs;
        static NamedEntry Read(IInputStream& stream, const Context& ctx, const NoArgs&)
        {
            RecordReader reader(stream, ctx, "NamedEntry");
            NamedEntry result;
            result._name = reader.Field<NullString>("name");
            result._id = reader.Field<uint16_t>("id");
            return result;
        }
    };

    TEST_CASE( "BinLayout-NullString", "[binlayout]" )
    {
        auto stream = MakeStream({'a', 'b', 'c', 0x00, 0x01, 0x02});
        auto str = ReadBE<NullString>(stream);
        REQUIRE(str == "abc");
        REQUIRE(str.AsString().size() == 3);
        REQUIRE(stream.TellPosition() == 4);

        auto empty = MakeStream({0x00});
        REQUIRE(ReadBE<NullString>(empty).AsString().empty());
        REQUIRE(empty.TellPosition() == 1);

        auto entry = MakeStream({'m', 'e', 's', 'h', 0x00, 0x00, 0x2a});
        auto e = ReadBE<NamedEntry>(entry);
        REQUIRE(e._name == "mesh");
        REQUIRE(e._id == 42);

            // stream ends before the terminator
        auto unterminated = MakeStream({'a', 'b'});
        REQUIRE_THROWS_AS(ReadBE<NullString>(unterminated), IOError);
    }

    TEST_CASE( "BinLayout-NullWideString", "[binlayout]" )
    {
        SECTION("Little endian")
        {
            auto stream = MakeStream({'h', 0x00, 'i', 0x00, 0x00, 0x00});
            auto str = ReadLE<NullWideString>(stream);
            REQUIRE(str._value == u"hi");
            REQUIRE(str.AsUTF8() == "hi");
            REQUIRE(stream.TellPosition() == 6);
        }

        SECTION("Big endian")
        {
            auto stream = MakeStream({0x00, 'h', 0x00, 'i', 0x00, 0x00});
            REQUIRE(ReadBE<NullWideString>(stream).AsUTF8() == "hi");
        }

        SECTION("Non-ascii characters")
        {
                // U+00E9, then U+1F600 as a surrogate pair
            auto stream = MakeStream({0x00, 0xe9, 0xd8, 0x3d, 0xde, 0x00, 0x00, 0x00});
            auto str = ReadBE<NullWideString>(stream);
            REQUIRE(str._value.size() == 3);
            REQUIRE(str.AsUTF8() == "\xc3\xa9\xf0\x9f\x98\x80");
        }

        SECTION("Unpaired surrogates")
        {
            auto stream = MakeStream({0xdc, 0x00, 0x00, 'a', 0xd8, 0x3d, 0x00, 0x00});
            REQUIRE(ReadBE<NullWideString>(stream).AsUTF8() == "\xef\xbf\xbd" "a" "\xef\xbf\xbd");
        }

        SECTION("Missing terminator")
        {
            auto stream = MakeStream({'h', 0x00, 'i'});
            REQUIRE_THROWS_AS(ReadLE<NullWideString>(stream), IOError);
        }
    }
}
