#pragma once
#include "config/Config.hpp"
#include "content/Value.hpp"
#include "core/Error.hpp"
#include "expr/Expression.hpp"
#include "scan/FieldOccurrence.hpp"
#include "util/Slugify.hpp"

#include <string>
#include <string_view>

namespace GB {

// Key used for empty raw keys when the config sets no replace_none_key.
inline constexpr std::string_view NoneKeySentinel = "none";

struct ResolvedKey {
    std::string key;    // final, slug-safe, never empty
    Value       keyObj; // after key_obj_fn and none substitution, before key_map
};

/**
 * Raw key object -> final key. Steps, in order:
 *  1. key_obj_fn (if set) replaces the object; `this` and `record` are the
 *     occurrence's record, locals X / key_obj hold the raw object, field_key
 *     and flow_key the occurrence location
 *  2. null or blank objects become replace_none_key (or NoneKeySentinel)
 *  3. key_map lookup on the string form
 *  4. slugify; an empty slug falls back to the slug of the none key
 *
 * Only scalar objects are accepted; lists and flows yield InvalidYield.
 * The function has no side effects.
 */
class KeyResolver {
public:
    KeyResolver(Config const& config, ExpressionEvaluator const& evaluator, SlugifyFn slugifyFn);

    auto resolve(Value const& raw, FieldOccurrence const* occurrence = nullptr) const -> Expected<ResolvedKey>;

    // Steps 3 and 4 only, for callers that already hold a canonical key object.
    auto finalKey(Value const& keyObj) const -> std::string;

private:
    auto noneKey() const -> std::string;

    Config const&              config_;
    ExpressionEvaluator const& evaluator_;
    SlugifyFn                  slugify_;
};

} // namespace GB
