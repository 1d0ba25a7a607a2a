#pragma once

#include "core/column_type.hpp"
#include "core/json.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbgate {

/**
 * @brief Closed set of decode strategies for a result cell
 */
enum class ValueClass {
    INTEGER,
    FLOAT,
    BOOLEAN,
    BINARY,
    TEXT,
};

/**
 * @brief Map a dialect-reported column type to its decode strategy.
 *
 * Integer family -> INTEGER, floating/decimal -> FLOAT, boolean -> BOOLEAN,
 * binary -> BINARY, everything else -> TEXT.
 */
[[nodiscard]] ValueClass classify(GenericColumnType type) noexcept;

/**
 * @brief Convert one native value into its canonical JSON form.
 *
 * Never throws. A null input yields JSON null. When the specific decode
 * fails the raw text is returned as a (lossy UTF-8) string.
 */
[[nodiscard]] Json marshal(ValueClass value_class, const std::optional<std::string>& raw);

/**
 * @brief Build one canonical row (column name -> value) from driver output
 */
[[nodiscard]] Json marshal_row(const std::vector<std::string>& column_names,
                               const std::vector<ColumnTypeInfo>& column_types,
                               const std::vector<std::optional<std::string>>& cells);

} // namespace dbgate
