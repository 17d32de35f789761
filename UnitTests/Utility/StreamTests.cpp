// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "../UnitTestHelper.h"
#include "../../Utility/Streams/Stream.h"
#include "catch2/catch_test_macros.hpp"
#include <filesystem>
#include <fstream>

namespace UnitTests
{
    static std::vector<uint8_t> ReadAll(IInputStream& stream, size_t maxCount)
    {
        std::vector<uint8_t> result(maxCount);
        auto count = stream.Read(MakeIteratorRange(result).Cast<void*>());
        result.resize(count);
        return result;
    }

    TEST_CASE( "Streams-MemoryInputStream", "[utility]" )
    {
        const uint8_t data[] = { 1, 2, 3, 4, 5 };
        MemoryInputStream stream(MakeIteratorRange(data));

        REQUIRE(ReadAll(stream, 2) == std::vector<uint8_t>{1, 2});
        REQUIRE(stream.TellPosition() == 2);

        stream.SeekRelative(-1);
        REQUIRE(ReadAll(stream, 2) == std::vector<uint8_t>{2, 3});

            // reads at the end return short
        stream.SeekAbsolute(4);
        REQUIRE(ReadAll(stream, 3) == std::vector<uint8_t>{5});
        REQUIRE(stream.TellPosition() == 5);

            // seeking beyond the end is allowed, but nothing can be read there
        stream.SeekAbsolute(100);
        REQUIRE(stream.TellPosition() == 100);
        REQUIRE(ReadAll(stream, 1).empty());

        stream.SeekAbsolute(1);
        REQUIRE_THROWS_AS(stream.SeekRelative(-2), StreamError);

        auto owned = MakeStream({9, 8});
        REQUIRE(owned.GetData().size() == 2);
        REQUIRE(ReadAll(owned, 8) == std::vector<uint8_t>{9, 8});
    }

    TEST_CASE( "Streams-LimitedInputStream", "[utility]" )
    {
        auto underlying = MakeStream({1, 2, 3, 4, 5, 6});
        underlying.SeekAbsolute(2);
        LimitedInputStream limited(underlying, 3);
        REQUIRE(limited.GetWindowBegin() == 2);
        REQUIRE(limited.GetWindowEnd() == 5);

            // positions are in the coordinates of the underlying stream
        REQUIRE(limited.TellPosition() == 2);
        REQUIRE(ReadAll(limited, 10) == std::vector<uint8_t>{3, 4, 5});
        REQUIRE(limited.TellPosition() == 5);
        REQUIRE(ReadAll(limited, 1).empty());

            // outside of the window nothing can be read
        limited.SeekAbsolute(0);
        REQUIRE(ReadAll(limited, 1).empty());
        limited.SeekAbsolute(3);
        REQUIRE(ReadAll(limited, 1) == std::vector<uint8_t>{4});
    }

    TEST_CASE( "Streams-FileInputStream", "[utility]" )
    {
        auto filename = (std::filesystem::temp_directory_path() / "binlayout-stream-test.bin").string();
        {
            std::ofstream out(filename, std::ios::out | std::ios::binary | std::ios::trunc);
            const char data[] = { 'a', 'b', 'c', 'd' };
            out.write(data, sizeof(data));
        }

        {
            FileInputStream stream(filename);
            REQUIRE(ReadAll(stream, 2) == std::vector<uint8_t>{'a', 'b'});
            stream.SeekAbsolute(3);
            REQUIRE(ReadAll(stream, 4) == std::vector<uint8_t>{'d'});
            REQUIRE(stream.TellPosition() == 4);
            REQUIRE(ReadAll(stream, 4).empty());
            stream.SeekRelative(-3);
            REQUIRE(ReadAll(stream, 1) == std::vector<uint8_t>{'b'});
        }

        std::filesystem::remove(filename);
        REQUIRE_THROWS_AS(FileInputStream(filename), StreamError);
    }
}
