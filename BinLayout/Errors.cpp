// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Errors.h"
#include <sstream>
#include <iomanip>

namespace BinLayout
{
    const char* AsString(ErrorKind kind)
    {
        switch (kind) {
        case ErrorKind::IO:             return "IO";
        case ErrorKind::BadMagic:       return "BadMagic";
        case ErrorKind::EnumErrors:     return "EnumErrors";
        case ErrorKind::NoVariantMatch: return "NoVariantMatch";
        case ErrorKind::Assertion:      return "Assertion";
        case ErrorKind::Custom:         return "Custom";
        default:                        return "<<unknown>>";
        }
    }

    static std::string PositionString(uint64_t position)
    {
        std::stringstream str;
        str << "0x" << std::hex << position;
        return str.str();
    }

    ReadError::ReadError(const std::string& msg, std::optional<uint64_t> position)
    : std::runtime_error(msg), _position(position)
    {}

    ReadError::~ReadError() = default;

///////////////////////////////////////////////////////////////////////////////////////////////////

    IOError::IOError(const std::string& streamMessage)
    : ReadError("IO error: " + streamMessage, {})
    {}

    std::shared_ptr<const ReadError> IOError::Clone() const { return std::make_shared<IOError>(*this); }

///////////////////////////////////////////////////////////////////////////////////////////////////

    static std::string BadMagicMessage(uint64_t position, const std::string& found)
    {
        return "Bad magic at " + PositionString(position) + " (found " + found + ")";
    }

    static std::string AsHexString(IteratorRange<const void*> bytes)
    {
        std::stringstream str;
        str << std::hex << std::setfill('0');
        for (auto b:bytes.Cast<const uint8_t*>())
            str << std::setw(2) << unsigned(b) << " ";
        auto result = str.str();
        if (!result.empty()) result.pop_back();
        return result;
    }

    BadMagic::BadMagic(uint64_t position, ImpliedTyping::VariantRetained found)
    : ReadError(BadMagicMessage(position, ImpliedTyping::AsString(found.GetData(), found._type, true)), position)
    , _found(found)
    {}

    BadMagic::BadMagic(uint64_t position, IteratorRange<const void*> foundBytes)
    : ReadError(BadMagicMessage(position, "bytes " + AsHexString(foundBytes)), position)
    , _foundBytes((const uint8_t*)foundBytes.begin(), (const uint8_t*)foundBytes.end())
    {}

    std::shared_ptr<const ReadError> BadMagic::Clone() const { return std::make_shared<BadMagic>(*this); }

///////////////////////////////////////////////////////////////////////////////////////////////////

    static std::string EnumErrorsMessage(uint64_t position, const std::vector<VariantAttempt>& variantErrors)
    {
        std::stringstream str;
        str << "No variant matched at " << PositionString(position) << ". Attempts:";
        for (const auto& v:variantErrors)
            str << std::endl << "  " << v._candidateName << ": " << (v._error ? v._error->what() : "<<no error>>");
        return str.str();
    }

    EnumErrors::EnumErrors(uint64_t position, std::vector<VariantAttempt> variantErrors)
    : ReadError(EnumErrorsMessage(position, variantErrors), position)
    , _variantErrors(std::move(variantErrors))
    {}

    std::shared_ptr<const ReadError> EnumErrors::Clone() const { return std::make_shared<EnumErrors>(*this); }

    NoVariantMatch::NoVariantMatch(uint64_t position)
    : ReadError("No variant matched at " + PositionString(position), position)
    {}

    std::shared_ptr<const ReadError> NoVariantMatch::Clone() const { return std::make_shared<NoVariantMatch>(*this); }

///////////////////////////////////////////////////////////////////////////////////////////////////

    AssertionFailure::AssertionFailure(uint64_t position, const std::string& message)
    : ReadError("Assertion failed at " + PositionString(position) + ": " + message, position)
    , _message(message)
    {}

    std::shared_ptr<const ReadError> AssertionFailure::Clone() const { return std::make_shared<AssertionFailure>(*this); }

    CustomError::CustomError(uint64_t position, const std::string& message)
    : ReadError("Error at " + PositionString(position) + ": " + message, position)
    , _message(message)
    {}

    std::shared_ptr<const ReadError> CustomError::Clone() const { return std::make_shared<CustomError>(*this); }
}
