#pragma once

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "options.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"

#ifndef ORDEREDJSON_MAX_EMBEDDING_DEPTH
#define ORDEREDJSON_MAX_EMBEDDING_DEPTH 8
#endif

namespace OrderedJson {

inline constexpr std::size_t MaxEmbeddingDepth = ORDEREDJSON_MAX_EMBEDDING_DEPTH;

struct TypeInfo;

// One visible member of an aggregate, as declared
struct FieldInfo {
    std::string_view name;
    std::size_t index = 0;
    bool tagged = false;
    bool omit_empty = false;
    bool quoted = false;
    // Set for embedded aggregates whose fields are promoted
    const TypeInfo & (*embedded_type)() = nullptr;
};

struct TypeInfo {
    std::type_index type;
    std::vector<FieldInfo> fields;
};

// A field as it appears in JSON after embedding and dominance are resolved
struct PlannedField {
    std::string name;
    std::vector<std::size_t> path;
    bool tagged = false;
    bool omit_empty = false;
    bool quoted = false;

    std::size_t depth() const {
        return path.size() - 1;
    }
};

namespace field_plan_detail {

constexpr char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

constexpr bool equal_fold_ascii(std::string_view a, std::string_view b) {
    if(a.size() != b.size()) return false;
    for(std::size_t i = 0; i < a.size(); i ++) {
        if(ascii_lower(a[i]) != ascii_lower(b[i])) return false;
    }
    return true;
}

} // namespace field_plan_detail

class FieldPlan {
    std::vector<PlannedField> m_fields;
public:
    FieldPlan() = default;
    explicit FieldPlan(std::vector<PlannedField> fields): m_fields(std::move(fields)) {}

    // Ordered by source path
    const std::vector<PlannedField> & fields() const {
        return m_fields;
    }

    // Exact name first, then the first ASCII case-insensitive match
    const PlannedField * find(std::string_view key) const {
        const PlannedField * folded = nullptr;
        for(const PlannedField & f : m_fields) {
            if(f.name == key) {
                return &f;
            }
            if(folded == nullptr && field_plan_detail::equal_fold_ascii(f.name, key)) {
                folded = &f;
            }
        }
        return folded;
    }
};

template<class T>
const TypeInfo & type_info_of();

namespace field_plan_detail {

template<class T, std::size_t Index>
void collect_field(std::vector<FieldInfo> & out) {
    using FieldOpts = options::detail::aggregate_field_opts<T, Index>;
    using Opts = typename FieldOpts::options;
    using V = typename FieldOpts::value_t;

    if constexpr (!Opts::template has_option<options::detail::skip_tag>) {
        constexpr bool isEmbedded = Opts::template has_option<options::detail::embedded_tag>;
        constexpr bool isUnexported = Opts::template has_option<options::detail::unexported_tag>;
        constexpr bool promoted = static_schema::is_promoted_member<T, Index>();

        if constexpr (isUnexported && (!isEmbedded || !static_schema::EmbeddableAggregate<V>)) {
            return;
        } else {
            FieldInfo f;
            f.index = Index;
            f.name = introspection::structureElementNameByIndex<Index, T>;
            if constexpr (Opts::template has_option<options::detail::key_tag>) {
                constexpr std::string_view key = Opts::template get_option<options::detail::key_tag>::desc.toStringView();
                if constexpr (!key.empty()) {
                    f.name = key;
                    f.tagged = true;
                }
            }
            f.omit_empty = Opts::template has_option<options::detail::omitempty_tag>;
            f.quoted = Opts::template has_option<options::detail::as_string_tag> && static_schema::JsonQuotable<V>;
            if constexpr (promoted) {
                f.embedded_type = &type_info_of<static_schema::embedded_target_t<V>>;
            }
            out.push_back(f);
        }
    }
}

template<class T, std::size_t... Index>
std::vector<FieldInfo> collect_fields(std::index_sequence<Index...>) {
    std::vector<FieldInfo> out;
    (collect_field<T, Index>(out), ...);
    return out;
}

// Same-name fields sorted by depth, tagged first. Returns nullptr when the name is dropped.
inline const PlannedField * dominant_field(const PlannedField * first, const PlannedField * last) {
    const std::size_t depth = first->path.size();
    const PlannedField * tagged = nullptr;
    std::size_t sameDepth = 0;
    for(const PlannedField * f = first; f != last; f ++) {
        if(f->path.size() > depth) {
            break;
        }
        sameDepth ++;
        if(f->tagged) {
            if(tagged != nullptr) {
                return nullptr;
            }
            tagged = f;
        }
    }
    if(tagged != nullptr) {
        return tagged;
    }
    if(sameDepth > 1) {
        return nullptr;
    }
    return first;
}

} // namespace field_plan_detail

// Breadth-first walk over the aggregate and its embedded aggregates, one depth level
// at a time; a type already expanded is not expanded again, a type embedded twice at
// one level yields duplicates that cancel out.
inline FieldPlan build_field_plan(const TypeInfo & root) {
    struct Pending {
        const TypeInfo * type;
        std::vector<std::size_t> path;
    };
    std::vector<Pending> current;
    std::vector<Pending> next{Pending{&root, {}}};
    std::unordered_map<std::type_index, int> count;
    std::unordered_map<std::type_index, int> nextCount;
    std::unordered_set<std::type_index> visited;
    std::vector<PlannedField> fields;

    while(!next.empty()) {
        current.swap(next);
        next.clear();
        count.swap(nextCount);
        nextCount.clear();

        for(const Pending & p : current) {
            if(!visited.insert(p.type->type).second) {
                continue;
            }
            const auto c = count.find(p.type->type);
            const bool multiple = c != count.end() && c->second > 1;

            for(const FieldInfo & fi : p.type->fields) {
                std::vector<std::size_t> path = p.path;
                path.push_back(fi.index);

                if(fi.embedded_type == nullptr) {
                    PlannedField f{std::string(fi.name), std::move(path), fi.tagged, fi.omit_empty, fi.quoted};
                    if(multiple) {
                        fields.push_back(f);
                    }
                    fields.push_back(std::move(f));
                    continue;
                }
                const TypeInfo & sub = fi.embedded_type();
                if(++nextCount[sub.type] == 1) {
                    next.push_back(Pending{&sub, std::move(path)});
                }
            }
        }
    }

    std::sort(fields.begin(), fields.end(), [](const PlannedField & a, const PlannedField & b) {
        if(a.name != b.name) return a.name < b.name;
        if(a.path.size() != b.path.size()) return a.path.size() < b.path.size();
        if(a.tagged != b.tagged) return a.tagged;
        return a.path < b.path;
    });

    std::vector<PlannedField> out;
    for(std::size_t i = 0; i < fields.size();) {
        std::size_t advance = 1;
        while(i + advance < fields.size() && fields[i + advance].name == fields[i].name) {
            advance ++;
        }
        const PlannedField * dominant = field_plan_detail::dominant_field(&fields[i], &fields[i] + advance);
        if(dominant != nullptr) {
            out.push_back(*dominant);
        }
        i += advance;
    }

    std::sort(out.begin(), out.end(), [](const PlannedField & a, const PlannedField & b) {
        return a.path < b.path;
    });
    return FieldPlan(std::move(out));
}

template<class T>
const TypeInfo & type_info_of() {
    static const TypeInfo info{
        std::type_index(typeid(T)),
        field_plan_detail::collect_fields<T>(std::make_index_sequence<introspection::structureElementsCount<T>>{})
    };
    return info;
}

// Process-wide plans keyed by type. A miss builds outside the lock; when two threads
// race on the same type the first published plan is kept.
class FieldPlanCache {
public:
    static FieldPlanCache & instance() {
        static FieldPlanCache cache;
        return cache;
    }

    const FieldPlan & get(const TypeInfo & info) {
        {
            std::shared_lock lock(m_mutex);
            auto it = m_plans.find(info.type);
            if(it != m_plans.end()) {
                return it->second;
            }
        }
        FieldPlan plan = build_field_plan(info);
        std::unique_lock lock(m_mutex);
        auto [it, inserted] = m_plans.try_emplace(info.type, std::move(plan));
        return it->second;
    }

    std::size_t size() const {
        std::shared_lock lock(m_mutex);
        return m_plans.size();
    }

private:
    FieldPlanCache() = default;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::type_index, FieldPlan> m_plans;
};

template<class T>
const FieldPlan & plan_for() {
    static const FieldPlan & plan = FieldPlanCache::instance().get(type_info_of<T>());
    return plan;
}

} // namespace OrderedJson
