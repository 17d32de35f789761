// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Utility/ImpliedTyping.h"
#include "../Utility/StringUtils.h"
#include <stdexcept>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace BinLayout
{
    enum class ErrorKind { IO, BadMagic, EnumErrors, NoVariantMatch, Assertion, Custom };
    const char* AsString(ErrorKind);

    /// <summary>Base for every failure raised while reading</summary>
    /// Catch this to handle any read failure. GetKind() identifies the concrete type,
    /// and GetPosition() gives the stream offset the failure relates to (empty for
    /// IOError, since the underlying stream doesn't report one).
    class ReadError : public std::runtime_error
    {
    public:
        virtual ErrorKind GetKind() const noexcept = 0;
        virtual std::shared_ptr<const ReadError> Clone() const = 0;
        std::optional<uint64_t> GetPosition() const noexcept { return _position; }

        ~ReadError();
    protected:
        ReadError(const std::string& msg, std::optional<uint64_t> position);
        std::optional<uint64_t> _position;
    };

    /// <summary>The stream could not supply the requested bytes, or couldn't seek</summary>
    class IOError : public ReadError
    {
    public:
        ErrorKind GetKind() const noexcept override { return ErrorKind::IO; }
        std::shared_ptr<const ReadError> Clone() const override;
        IOError(const std::string& streamMessage);
    };

    /// <summary>A fixed discriminator value did not match</summary>
    class BadMagic : public ReadError
    {
    public:
        ErrorKind GetKind() const noexcept override { return ErrorKind::BadMagic; }
        std::shared_ptr<const ReadError> Clone() const override;

        /// <summary>The value that was read in place of the expected magic</summary>
        /// Empty for byte-string magics; use GetFoundBytes() for those.
        const std::optional<ImpliedTyping::VariantRetained>& GetFound() const { return _found; }
        const std::vector<uint8_t>& GetFoundBytes() const { return _foundBytes; }

        BadMagic(uint64_t position, ImpliedTyping::VariantRetained found);
        BadMagic(uint64_t position, IteratorRange<const void*> foundBytes);
    private:
        std::optional<ImpliedTyping::VariantRetained> _found;
        std::vector<uint8_t> _foundBytes;
    };

    struct VariantAttempt
    {
        std::string _candidateName;
        std::shared_ptr<const ReadError> _error;
    };

    /// <summary>Every candidate of a variant failed; one record per candidate in the order tried</summary>
    class EnumErrors : public ReadError
    {
    public:
        ErrorKind GetKind() const noexcept override { return ErrorKind::EnumErrors; }
        std::shared_ptr<const ReadError> Clone() const override;
        const std::vector<VariantAttempt>& GetVariantErrors() const { return _variantErrors; }

        EnumErrors(uint64_t position, std::vector<VariantAttempt> variantErrors);
    private:
        std::vector<VariantAttempt> _variantErrors;
    };

    /// <summary>Every candidate of a variant failed (reduced detail form)</summary>
    class NoVariantMatch : public ReadError
    {
    public:
        ErrorKind GetKind() const noexcept override { return ErrorKind::NoVariantMatch; }
        std::shared_ptr<const ReadError> Clone() const override;
        NoVariantMatch(uint64_t position);
    };

    /// <summary>A post-read condition on a record did not hold</summary>
    class AssertionFailure : public ReadError
    {
    public:
        ErrorKind GetKind() const noexcept override { return ErrorKind::Assertion; }
        std::shared_ptr<const ReadError> Clone() const override;
        const std::string& GetMessage() const { return _message; }
        AssertionFailure(uint64_t position, const std::string& message);
    private:
        std::string _message;
    };

    /// <summary>Failure raised by client code (custom parsers, or validation in a Read)</summary>
    class CustomError : public ReadError
    {
    public:
        ErrorKind GetKind() const noexcept override { return ErrorKind::Custom; }
        std::shared_ptr<const ReadError> Clone() const override;
        const std::string& GetMessage() const { return _message; }
        CustomError(uint64_t position, const std::string& message);
    private:
        std::string _message;
    };
}
