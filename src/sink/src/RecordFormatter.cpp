#include "RecordFormatter.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace {

std::string value_to_csv(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return RecordFormatter::csv_escape(v);
        } else {
            return fmt::format("{}", v);
        }
    }, value);
}

void append_common_csv(std::string& line, const CommonFieldBlock& c) {
    line += TimestampUtils::format_datetime(c.timestamp);
    for (const std::string* field : {&c.module_id, &c.datacenter, &c.room, &c.rack, &c.device_hostname,
                                     &c.device_ip, &c.device_vendor, &c.interface, &c.speed}) {
        line += ',';
        line += RecordFormatter::csv_escape(*field);
    }
}

}

std::string RecordFormatter::csv_escape(const std::string& text) {
    if (text.find_first_of(",\"\r\n") == std::string::npos) {
        return text;
    }
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted += '"';
    for (char c : text) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string RecordFormatter::csv_header(const TableSchema& schema) {
    std::string line;
    for (const auto& name : schema.column_names()) {
        if (!line.empty()) line += ',';
        line += csv_escape(name);
    }
    return line;
}

std::string RecordFormatter::csv_line(const Record& record) {
    std::string line;
    line.reserve(256);
    append_common_csv(line, record.common);
    for (const auto& value : record.values) {
        line += ',';
        line += value_to_csv(value);
    }
    return line;
}

nlohmann::ordered_json RecordFormatter::to_json(const TableSchema& schema, const Record& record) {
    const CommonFieldBlock& c = record.common;
    nlohmann::ordered_json json;
    json["timestamp"] = TimestampUtils::format_datetime(c.timestamp);
    json["module_id"] = c.module_id;
    json["datacenter"] = c.datacenter;
    json["room"] = c.room;
    json["rack"] = c.rack;
    json["device_hostname"] = c.device_hostname;
    json["device_ip"] = c.device_ip;
    json["device_vendor"] = c.device_vendor;
    json["interface"] = c.interface;
    json["speed"] = c.speed;

    const auto& fields = schema.fields();
    if (fields.size() != record.values.size()) {
        throw std::invalid_argument("Record of " + std::to_string(record.values.size()) +
                                    " values does not match table " + schema.name());
    }
    for (size_t i = 0; i < fields.size(); ++i) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                json[fields[i].name] = nullptr;
            } else {
                json[fields[i].name] = v;
            }
        }, record.values[i]);
    }
    return json;
}

std::string RecordFormatter::format_batch(const TableSchema& schema, const RecordBatch& batch, OutputFormat format) {
    std::string out;
    out.reserve(batch.size() * 320);
    for (const auto& record : batch) {
        if (format == OutputFormat::JsonLines) {
            out += to_json(schema, record).dump();
        } else {
            out += csv_line(record);
        }
        out += '\n';
    }
    return out;
}
