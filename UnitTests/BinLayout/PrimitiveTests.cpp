// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "../UnitTestHelper.h"
#include "../../BinLayout/BinLayout.h"
#include "../../OSServices/Log.h"
#include <sstream>
#include <vector>
#include <cstring>
#include <limits>
#include "catch2/catch_test_macros.hpp"

using namespace BinLayout;

namespace UnitTests
{
        // encode "value" in the given byte order, then decode it again through the runtime
    template<typename Type>
        static void CheckRoundTrip(Type value, Endian byteOrder)
    {
        Type encoded = RequiresByteSwap(byteOrder) ? FlipEndian(value) : value;
        std::vector<uint8_t> bytes(sizeof(Type));
        std::memcpy(bytes.data(), &encoded, sizeof(Type));
        MemoryInputStream stream(std::move(bytes));
        REQUIRE(ReadType<Type>(stream, byteOrder) == value);
        REQUIRE(stream.TellPosition() == sizeof(Type));
    }

    template<typename Type>
        static void CheckRoundTrip(Type value)
    {
        for (auto byteOrder:{Endian::Big, Endian::Little, Endian::Native})
            CheckRoundTrip(value, byteOrder);
    }

    TEST_CASE( "BinLayout-PrimitiveDecode", "[binlayout]" )
    {
        SECTION("Integers in both byte orders")
        {
            auto stream = MakeStream({0x12, 0x34, 0x56, 0x78});
            REQUIRE(ReadBE<uint32_t>(stream) == 0x12345678u);
            stream.SeekAbsolute(0);
            REQUIRE(ReadLE<uint32_t>(stream) == 0x78563412u);
            stream.SeekAbsolute(0);
            REQUIRE(ReadBE<uint16_t>(stream) == 0x1234u);
            REQUIRE(ReadLE<uint16_t>(stream) == 0x7856u);
            REQUIRE(stream.TellPosition() == 4);
        }

        SECTION("Signed integers")
        {
            auto stream = MakeStream({0xff, 0xfe, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xff});
            REQUIRE(ReadBE<int16_t>(stream) == -2);
            REQUIRE(ReadBE<int64_t>(stream) == std::numeric_limits<int64_t>::min());
            REQUIRE(ReadBE<int8_t>(stream) == -1);
        }

        SECTION("Floating point")
        {
            auto stream = MakeStream({0x40, 0x60, 0x00, 0x00, 0x00, 0x00, 0x60, 0x40});
            REQUIRE(ReadBE<float>(stream) == 3.5f);
            REQUIRE(ReadLE<float>(stream) == 3.5f);

            auto doubleStream = MakeStream({0x3f, 0xf0, 0, 0, 0, 0, 0, 0});
            REQUIRE(ReadBE<double>(doubleStream) == 1.0);
        }

        SECTION("Native byte order matches the host")
        {
            uint32_t value = 0xdeadbeef;
            MemoryInputStream stream(MakeOpaqueIteratorRange(value));
            REQUIRE(ReadNE<uint32_t>(stream) == 0xdeadbeef);
            stream.SeekAbsolute(0);
            REQUIRE(ReadType<uint32_t>(stream, GetHostEndian()) == 0xdeadbeef);
        }

        SECTION("Characters decode from a single byte")
        {
            auto stream = MakeStream({'A', 0xe9});
            REQUIRE(ReadBE<char>(stream) == 'A');
            REQUIRE(ReadBE<char32_t>(stream) == char32_t(0xe9));
            REQUIRE(stream.TellPosition() == 2);
        }

        SECTION("Short stream raises IOError")
        {
            auto stream = MakeStream({0x01, 0x02, 0x03});
            REQUIRE_THROWS_AS(ReadBE<uint32_t>(stream), IOError);
            try {
                stream.SeekAbsolute(0);
                ReadLE<uint64_t>(stream);
                FAIL("Expected an exception");
            } catch (const ReadError& e) {
                REQUIRE(e.GetKind() == ErrorKind::IO);
                REQUIRE(!e.GetPosition().has_value());
            }
        }

        SECTION("Arrays, tuples and pairs read in declaration order")
        {
            auto stream = MakeStream({0x00, 0x01, 0x00, 0x02, 0x03, 0x00, 0x04, 0x05});
            auto arr = ReadBE<std::array<uint16_t, 2>>(stream);
            REQUIRE(arr[0] == 1);
            REQUIRE(arr[1] == 2);
            auto tuple = ReadBE<std::tuple<uint8_t, uint16_t>>(stream);
            REQUIRE(std::get<0>(tuple) == 3);
            REQUIRE(std::get<1>(tuple) == 4);
            auto pair = ReadBE<std::pair<uint8_t, std::array<uint8_t, 0>>>(stream);
            REQUIRE(pair.first == 5);
            REQUIRE(stream.TellPosition() == 8);
        }

        SECTION("Boxed values")
        {
            auto stream = MakeStream({0x00, 0x2a});
            auto boxed = ReadBE<std::unique_ptr<uint16_t>>(stream);
            REQUIRE(boxed);
            REQUIRE(*boxed == 42);
        }
    }

    TEST_CASE( "BinLayout-FixedWidthRoundTrip", "[binlayout]" )
    {
        CheckRoundTrip<int8_t>(-100);
        CheckRoundTrip<int16_t>(-12345);
        CheckRoundTrip<int32_t>(-123456789);
        CheckRoundTrip<int64_t>(-1234567890123456789ll);
        CheckRoundTrip<uint8_t>(0xa5);
        CheckRoundTrip<uint16_t>(0xa55a);
        CheckRoundTrip<uint32_t>(0xdeadbeefu);
        CheckRoundTrip<uint64_t>(0x0123456789abcdefull);
        CheckRoundTrip<float>(-1.5e-3f);
        CheckRoundTrip<double>(6.02214076e23);
        CheckRoundTrip<int64_t>(std::numeric_limits<int64_t>::min());
        CheckRoundTrip<uint64_t>(std::numeric_limits<uint64_t>::max());

            // explicit bytes, so a symmetric mistake in encode and decode can't hide
        auto ascending = MakeStream({0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08});
        REQUIRE(ReadBE<uint64_t>(ascending) == 0x0102030405060708ull);
        ascending.SeekAbsolute(0);
        REQUIRE(ReadLE<uint64_t>(ascending) == 0x0807060504030201ull);

        auto bigMinusTwo = MakeStream({0xff, 0xff, 0xff, 0xfe});
        REQUIRE(ReadBE<int32_t>(bigMinusTwo) == -2);
        auto littleMinusTwo = MakeStream({0xfe, 0xff, 0xff, 0xff});
        REQUIRE(ReadLE<int32_t>(littleMinusTwo) == -2);
    }

    TEST_CASE( "BinLayout-PrimitiveClassification", "[binlayout]" )
    {
        STATIC_REQUIRE(BinLayout::Internal::IsPrimitive<uint64_t>);
        STATIC_REQUIRE(BinLayout::Internal::IsPrimitive<unsigned long long>);
        STATIC_REQUIRE(BinLayout::Internal::IsPrimitive<char>);
        STATIC_REQUIRE(BinLayout::Internal::IsPrimitive<char32_t>);
        STATIC_REQUIRE(!BinLayout::Internal::IsPrimitive<bool>);
            // wide characters have no single on-disk width
        STATIC_REQUIRE(!BinLayout::Internal::IsPrimitive<char16_t>);
        STATIC_REQUIRE(!BinLayout::Internal::IsPrimitive<wchar_t>);
            // never completes the type, so it's safe for records that refer to themselves
        struct Incomplete;
        STATIC_REQUIRE(!BinLayout::Internal::IsPrimitive<Incomplete>);
    }

    TEST_CASE( "BinLayout-ByteOrderMark", "[binlayout]" )
    {
        REQUIRE(FromBigEndianBOM(0xfeff) == Endian::Big);
        REQUIRE(FromBigEndianBOM(0xfffe) == Endian::Little);
        REQUIRE(!FromBigEndianBOM(0x1234).has_value());
        REQUIRE(FromLittleEndianBOM(0xfeff) == Endian::Little);
        REQUIRE(FromLittleEndianBOM(0xfffe) == Endian::Big);

        auto little = MakeStream({0xff, 0xfe});
        REQUIRE(ParseByteOrderMark(little, Context{}) == Endian::Little);

        auto big = MakeStream({0xfe, 0xff});
        REQUIRE(ParseByteOrderMark(big, Context{Endian::Little}) == Endian::Big);

        auto bad = MakeStream({0x00, 0x00, 0xfe, 0xfe});
        bad.SeekAbsolute(2);
        try {
            ParseByteOrderMark(bad, Context{});
            FAIL("Expected an exception");
        } catch (const BadMagic& e) {
            REQUIRE(e.GetPosition() == 2u);
            REQUIRE(e.GetFound().has_value());
            REQUIRE(e.GetFound()->RequireCastValue<uint16_t>() == 0xfefe);
        }
    }

    TEST_CASE( "BinLayout-TraceReads", "[binlayout]" )
    {
        std::stringstream traceOutput;
        OSServices::MessageTargetConfiguration cfg;
        cfg._enabled = true;
        cfg._outputStream = &traceOutput;
        auto cfgSet = std::make_shared<OSServices::LogConfigurationSet>();
        cfgSet->Set("Verbose", cfg);
        OSServices::LogCentral::GetInstance()->SetConfiguration(cfgSet);

        auto stream = MakeStream({0x00, 0x00, 0x01, 0x00});
        auto ctx = Context{Endian::Big}.WithDiagnostics(DiagnosticFlags::TraceReads).With<ContextKey::VariableName>("count");
        auto value = BinLayout::Read<uint32_t>(stream, ctx);
        OSServices::LogCentral::GetInstance()->SetConfiguration(nullptr);

        REQUIRE(value == 256);
        auto trace = traceOutput.str();
        REQUIRE(trace.find("uint32") != std::string::npos);
        REQUIRE(trace.find("count") != std::string::npos);
        REQUIRE(trace.find("256") != std::string::npos);

            // without the diagnostic flag, nothing is written
        traceOutput.str(std::string{});
        stream.SeekAbsolute(0);
        BinLayout::Read<uint32_t>(stream, Context{Endian::Big});
        REQUIRE(traceOutput.str().empty());
    }
}
