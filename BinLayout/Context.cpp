// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Context.h"

namespace BinLayout
{
    struct Context::ExtensionNode
    {
        std::type_index _key;
        std::any _value;
        std::shared_ptr<const ExtensionNode> _next;
    };

    const std::any* Context::FindExtension(std::type_index key) const
    {
            // the most recent override is at the head of the list, and shadows earlier ones
        for (auto* node = _extensions.get(); node; node = node->_next.get())
            if (node->_key == key)
                return &node->_value;
        return nullptr;
    }

    Context Context::WithExtension(std::type_index key, std::any&& value) const
    {
        Context result = *this;
        result._extensions = std::make_shared<const ExtensionNode>(ExtensionNode{key, std::move(value), _extensions});
        return result;
    }

    void Context::ThrowMissingKey(std::type_index key)
    {
        Throw(std::out_of_range(std::string{"Context does not contain a value for key ("} + key.name() + ") and the key has no default"));
    }

    Context::Context(Endian byteOrder)
    : _byteOrder(byteOrder)
    {}

    Context::~Context() = default;
    Context::Context(const Context&) = default;
    Context& Context::operator=(const Context&) = default;
    Context::Context(Context&&) noexcept = default;
    Context& Context::operator=(Context&&) noexcept = default;
}
