#include "core/value_marshaller.hpp"
#include "core/utils.hpp"

#include <cmath>

namespace dbgate {

ValueClass classify(GenericColumnType type) noexcept {
    switch (type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
            return ValueClass::INTEGER;

        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
            return ValueClass::FLOAT;

        case GenericColumnType::BOOLEAN:
            return ValueClass::BOOLEAN;

        case GenericColumnType::BLOB:
            return ValueClass::BINARY;

        case GenericColumnType::UNKNOWN:
        case GenericColumnType::TEXT:
        case GenericColumnType::VARCHAR:
        case GenericColumnType::CHAR:
        case GenericColumnType::DATE:
        case GenericColumnType::TIME:
        case GenericColumnType::TIMESTAMP:
        case GenericColumnType::TIMESTAMP_TZ:
        case GenericColumnType::INTERVAL:
        case GenericColumnType::JSON:
        case GenericColumnType::JSONB:
        case GenericColumnType::UUID:
        case GenericColumnType::INET:
        case GenericColumnType::MACADDR:
        case GenericColumnType::MONEY:
        case GenericColumnType::XML:
        case GenericColumnType::ARRAY:
        case GenericColumnType::VENDOR_SPECIFIC:
            return ValueClass::TEXT;
    }
    return ValueClass::TEXT;
}

namespace {

std::optional<bool> parse_bool(std::string_view text) {
    const std::string lower = utils::to_lower(utils::trim(text));
    if (lower == "t" || lower == "true" || lower == "1") return true;
    if (lower == "f" || lower == "false" || lower == "0") return false;
    return std::nullopt;
}

} // anonymous namespace

Json marshal(ValueClass value_class, const std::optional<std::string>& raw) {
    if (!raw) {
        return nullptr;
    }
    const std::string& text = *raw;

    switch (value_class) {
        case ValueClass::INTEGER:
            if (const auto v = utils::try_parse_int<int64_t>(text)) {
                return *v;
            }
            // Out of int64 range (e.g. BIGINT UNSIGNED)
            if (const auto u = utils::try_parse_int<uint64_t>(text)) {
                return *u;
            }
            break;

        case ValueClass::FLOAT:
            if (const auto d = utils::try_parse_double(text); d && std::isfinite(*d)) {
                return *d;
            }
            break;

        case ValueClass::BOOLEAN:
            if (const auto b = parse_bool(text)) {
                return *b;
            }
            break;

        case ValueClass::BINARY:
        case ValueClass::TEXT:
            break;
    }
    return utils::lossy_utf8(text);
}

Json marshal_row(const std::vector<std::string>& column_names,
                 const std::vector<ColumnTypeInfo>& column_types,
                 const std::vector<std::optional<std::string>>& cells) {
    Json row = Json::object();
    for (size_t i = 0; i < column_names.size(); ++i) {
        const auto type = i < column_types.size()
            ? column_types[i].generic_type : GenericColumnType::UNKNOWN;
        const std::optional<std::string> none;
        row[column_names[i]] = marshal(classify(type), i < cells.size() ? cells[i] : none);
    }
    return row;
}

} // namespace dbgate
