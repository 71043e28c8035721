#include <safejump/config.hpp>
#include <safejump/core/byte_string.hpp>
#include <safejump/core/bytes.hpp>
#include <safejump/deploy/code_store.hpp>

#include <optional>

SAFEJUMP_NAMESPACE_BEGIN

bool CodeStore::contains(bytes32_t const &hash) const
{
    return code_.contains(hash);
}

std::optional<byte_string_view> CodeStore::get(bytes32_t const &hash) const
{
    auto const it = code_.find(hash);
    if (it == code_.end()) {
        return std::nullopt;
    }
    return byte_string_view{it->second};
}

bool CodeStore::put(bytes32_t const &hash, byte_string_view const code)
{
    auto const [it, inserted] = code_.try_emplace(hash, code);
    return inserted;
}

SAFEJUMP_NAMESPACE_END
