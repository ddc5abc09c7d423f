#include "libwire/key.hpp"
#include "libwire/exceptions.hpp"

#include <boost/container_hash/hash.hpp>

#include <string>
#include <utility>

namespace libwire {

key::key(std::string label)
    : parts_{std::move(label)}
{}

key::key(std::initializer_list<std::string> parts)
    : parts_(parts)
{}

std::string key::label() const {
    std::string out;
    for (std::size_t i = 0; i < parts_.size(); ++i) {
        if (i > 0) out += ':';
        out += parts_[i];
    }
    return out;
}

std::size_t key::hash() const noexcept {
    return boost::hash_range(parts_.begin(), parts_.end());
}

dependency_key::dependency_key(key k)
    : value_(std::move(k))
{}

dependency_key::dependency_key(std::type_index type)
    : value_(type)
{}

std::optional<std::type_index> dependency_key::type() const noexcept {
    if (const auto* t = std::get_if<std::type_index>(&value_)) return *t;
    return std::nullopt;
}

std::string dependency_key::to_string() const {
    if (const auto* k = named()) {
        std::string out = "key(";
        for (std::size_t i = 0; i < k->parts().size(); ++i) {
            if (i > 0) out += ", ";
            out += "\"" + k->parts()[i] + "\"";
        }
        return out + ")";
    }
    return internal::demangle(std::get<std::type_index>(value_));
}

std::size_t dependency_key::hash() const noexcept {
    std::size_t seed = value_.index();
    if (const auto* k = named()) {
        boost::hash_combine(seed, k->hash());
    } else {
        boost::hash_combine(seed, std::get<std::type_index>(value_).hash_code());
    }
    return seed;
}

} // namespace libwire
