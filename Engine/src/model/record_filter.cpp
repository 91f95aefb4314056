#include <model/record_filter.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>

namespace Coalesce {

RecordFilter RecordFilter::not_null(std::string field) {
    RecordFilter f;
    f.field = std::move(field);
    f.op = Op::NotNull;
    return f;
}

RecordFilter RecordFilter::equals(std::string field, nlohmann::json value) {
    RecordFilter f;
    f.field = std::move(field);
    f.op = Op::Equals;
    f.value = std::move(value);
    return f;
}

RecordFilter RecordFilter::not_equals(std::string field, nlohmann::json value) {
    RecordFilter f = equals(std::move(field), std::move(value));
    f.op = Op::NotEquals;
    return f;
}

RecordFilter RecordFilter::in(std::string field, nlohmann::json values) {
    RecordFilter f;
    f.field = std::move(field);
    f.op = Op::In;
    f.value = std::move(values);
    return f;
}

RecordFilter RecordFilter::range(std::string field, std::optional<double> min_value, std::optional<double> max_value) {
    RecordFilter f;
    f.field = std::move(field);
    f.op = Op::Range;
    f.min_value = min_value;
    f.max_value = max_value;
    return f;
}

RecordFilter RecordFilter::longer_than(std::string field, size_t min_length) {
    RecordFilter f;
    f.field = std::move(field);
    f.op = Op::MinLength;
    f.min_length = min_length;
    return f;
}

bool RecordFilter::matches(const Record& record) const {
    switch (op) {
        case Op::NotNull:
            return record.has(field);
        case Op::Equals:
            return record.has(field) && record.fields.at(field) == value;
        case Op::NotEquals:
            return !record.has(field) || record.fields.at(field) != value;
        case Op::In: {
            if (!record.has(field)) return false;
            const auto& v = record.fields.at(field);
            for (const auto& candidate : value) {
                if (candidate == v) return true;
            }
            return false;
        }
        case Op::Range: {
            auto n = record.number(field);
            if (!n) return false;
            if (min_value && *n < *min_value) return false;
            if (max_value && *n > *max_value) return false;
            return true;
        }
        case Op::MinLength: {
            auto t = record.text(field);
            return t && t->size() >= min_length;
        }
    }
    return false;
}

const char* to_string(RecordFilter::Op op) {
    switch (op) {
        case RecordFilter::Op::NotNull:   return "not_null";
        case RecordFilter::Op::Equals:    return "equals";
        case RecordFilter::Op::NotEquals: return "not_equals";
        case RecordFilter::Op::In:        return "in";
        case RecordFilter::Op::Range:     return "range";
        case RecordFilter::Op::MinLength: return "min_length";
    }
    return "unknown";
}

RecordFilter RecordFilter::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("field") || !j["field"].is_string()) {
        throw ConfigurationError("filter requires a string 'field'");
    }
    const std::string field = j["field"].get<std::string>();
    const std::string op = j.value("op", std::string("not_null"));

    if (op == "not_null") return not_null(field);
    if (op == "equals" || op == "not_equals" || op == "in") {
        if (!j.contains("value")) throw ConfigurationError("filter '" + op + "' on " + field + " requires 'value'");
        if (op == "equals") return equals(field, j["value"]);
        if (op == "not_equals") return not_equals(field, j["value"]);
        return in(field, j["value"]);
    }
    if (op == "range") {
        std::optional<double> lo, hi;
        if (j.contains("min")) lo = j["min"].get<double>();
        if (j.contains("max")) hi = j["max"].get<double>();
        return range(field, lo, hi);
    }
    if (op == "min_length") {
        return longer_than(field, j.value("length", size_t(1)));
    }
    throw ConfigurationError("unknown filter operator '" + op + "'");
}

nlohmann::json RecordFilter::to_json() const {
    nlohmann::json j = {{"field", field}, {"op", to_string(op)}};
    switch (op) {
        case Op::Equals:
        case Op::NotEquals:
        case Op::In:
            j["value"] = value;
            break;
        case Op::Range:
            if (min_value) j["min"] = *min_value;
            if (max_value) j["max"] = *max_value;
            break;
        case Op::MinLength:
            j["length"] = min_length;
            break;
        case Op::NotNull:
            break;
    }
    return j;
}

bool matches_all(const std::vector<RecordFilter>& filters, const Record& record) {
    for (const auto& f : filters) {
        if (!f.matches(record)) return false;
    }
    return true;
}

void validate_filters(const std::vector<RecordFilter>& filters) {
    for (const auto& f : filters) {
        validate_identifier(f.field, "filter field");
        switch (f.op) {
            case RecordFilter::Op::In:
                if (!f.value.is_array()) {
                    throw ConfigurationError("'in' filter on " + f.field + " requires an array value");
                }
                break;
            case RecordFilter::Op::Range:
                if (!f.min_value && !f.max_value) {
                    throw ConfigurationError("range filter on " + f.field + " has no bounds");
                }
                if (f.min_value && f.max_value && *f.min_value > *f.max_value) {
                    throw ConfigurationError("range filter on " + f.field + " has min > max");
                }
                break;
            case RecordFilter::Op::Equals:
            case RecordFilter::Op::NotEquals:
                if (f.value.is_structured()) {
                    throw ConfigurationError("equality filter on " + f.field + " requires a scalar value");
                }
                break;
            default:
                break;
        }
    }
}

} // namespace Coalesce
