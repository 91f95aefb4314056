#include <model/record.hpp>
#include <algorithm>
#include <cctype>

namespace Coalesce {

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

Record::Record(std::string record_id, nlohmann::json record_fields)
    : id(std::move(record_id)), fields(std::move(record_fields)) {
    if (fields.is_null()) fields = nlohmann::json::object();
}

bool Record::has(const std::string& field) const {
    if (!fields.is_object()) return false;
    auto it = fields.find(field);
    if (it == fields.end() || it->is_null()) return false;
    if (it->is_string()) return !is_blank(it->get_ref<const std::string&>());
    return true;
}

std::optional<std::string> Record::text(const std::string& field) const {
    if (!has(field)) return std::nullopt;
    const auto& v = fields.at(field);

    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number_unsigned()) return std::to_string(v.get<unsigned long long>());
    if (v.is_number_float()) return v.dump();
    if (v.is_boolean()) return v.get<bool>() ? std::string("true") : std::string("false");
    return std::nullopt;
}

std::optional<std::vector<double>> Record::vector(const std::string& field) const {
    if (!has(field)) return std::nullopt;
    const auto& v = fields.at(field);
    if (!v.is_array() || v.empty()) return std::nullopt;

    std::vector<double> out;
    out.reserve(v.size());
    for (const auto& x : v) {
        if (!x.is_number()) return std::nullopt;
        out.push_back(x.get<double>());
    }
    return out;
}

std::optional<double> Record::number(const std::string& field) const {
    if (!has(field)) return std::nullopt;
    const auto& v = fields.at(field);
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        try {
            size_t pos = 0;
            const auto& s = v.get_ref<const std::string&>();
            double d = std::stod(s, &pos);
            if (pos == s.size()) return d;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace Coalesce
