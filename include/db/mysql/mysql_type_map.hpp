#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>
#include <cstdint>

namespace dbgate {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL field metadata to GenericColumnType.
 */
class MysqlTypeMap {
public:
    // MySQL's pseudo charset number for binary strings
    static constexpr unsigned int kBinaryCharset = 63;

    /**
     * @brief Map MySQL field type to GenericColumnType
     * @param field_type MySQL enum_field_types value
     * @param length Declared display length (TINYINT(1) is a boolean)
     * @param charsetnr Character set number (63 = binary)
     */
    [[nodiscard]] static GenericColumnType field_type_to_generic(
        enum_field_types field_type, unsigned long length, unsigned int charsetnr);

    /**
     * @brief Build a full ColumnTypeInfo from a result field
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const MYSQL_FIELD& field);
};

} // namespace dbgate
