#include "resolvers/composite_key_resolver.hpp"
#include "rate_limit_errors.hpp"

#include <utility>

namespace turnstile {

CompositeKeyResolver::CompositeKeyResolver(std::vector<std::unique_ptr<KeyResolver>> children)
    : children_(std::move(children))
{
    if (children_.size() < 2) {
        throw ConfigError("Composite resolver requires at least two children");
    }
    for (const auto& child : children_) {
        if (!child) {
            throw ConfigError("Composite resolver child is null");
        }
    }
}

std::string CompositeKeyResolver::escape(const std::string& part) {
    std::string out;
    out.reserve(part.size());
    for (char c : part) {
        if (c == '%') {
            out += "%25";
        } else if (c == kSeparator) {
            out += "%7C";
        } else {
            out += c;
        }
    }
    return out;
}

std::string CompositeKeyResolver::resolve(const ClientRequest& request) const {
    std::string key = "composite:";
    for (size_t i = 0; i < children_.size(); ++i) {
        if (i > 0) key += kSeparator;
        key += escape(children_[i]->resolve(request));
    }
    return key;
}

std::string CompositeKeyResolver::name() const {
    std::string n;
    for (const auto& child : children_) {
        if (!n.empty()) n += '+';
        n += child->name();
    }
    return n;
}

}
