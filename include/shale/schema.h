/**
 * Schema / field catalog
 *
 * A dataset schema is a tree of fields. Every field (nested members
 * included) carries a dataset-wide integer id assigned once, in pre-order,
 * as a contiguous block after the current maximum field id.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <shale/status.h>

namespace arrow {
class DataType;
class Field;
class Schema;
}

namespace shale {

// Field id sentinels
constexpr int32_t kUnassignedFieldId = -1;
constexpr int32_t kTombstonedFieldId = -2;

struct Field {
    std::string name;
    int32_t id = kUnassignedFieldId;
    int32_t parent_id = -1;
    std::string logical_type;
    bool nullable = true;
    std::map<std::string, std::string> metadata;
    std::vector<Field> children;

    bool IsNested() const { return !children.empty(); }
};

class Schema {
public:
    Schema() = default;
    Schema(std::vector<Field> fields, std::map<std::string, std::string> metadata = {});

    // Builds an unassigned schema (all ids -1) from an Arrow schema.
    // Fixed-size lists of primitives are leaves and get a single id.
    static Status FromArrow(const arrow::Schema& arrow_schema, Schema* schema);

    const std::vector<Field>& fields() const { return fields_; }
    const std::map<std::string, std::string>& metadata() const { return metadata_; }
    void set_metadata(std::map<std::string, std::string> metadata) {
        metadata_ = std::move(metadata);
    }

    bool empty() const { return fields_.empty(); }

    // Pre-order walk over every field, nested ones included.
    std::vector<const Field*> AllFields() const;
    std::vector<int32_t> FieldIds() const;

    // -1 if no field has an id.
    int32_t MaxFieldId() const;

    const Field* FieldById(int32_t id) const;
    Field* MutableFieldById(int32_t id);

    // Dotted path lookup, e.g. "location.lat".
    const Field* FieldByPath(const std::string& path) const;

    // Every id assigned, none duplicated.
    Status Validate() const;

    bool operator==(const Schema& other) const;

private:
    std::vector<Field> fields_;
    std::map<std::string, std::string> metadata_;
};

/**
 * @brief Assign field ids to every unassigned field of the schema
 *
 * Ids form a contiguous block starting at current_max_field_id + 1, in
 * pre-order, covering nested struct/list members. Parent links are updated.
 *
 * @return The newly assigned ids, in assignment order
 */
std::vector<int32_t> AssignFieldIds(Schema* schema, int32_t current_max_field_id);

// Number of top-level physical columns a field owns in a file of the newer
// storage generation. Zero for fields living inside another field's column
// (members of a packed struct, for example).
struct FieldLayout {
    int32_t field_id = kUnassignedFieldId;
    int32_t num_columns = 1;
};

/**
 * @brief Compute DataFile column indices from a physical layout
 *
 * Produces exactly one entry per field: the position of the field's first
 * top-level column, or -1 when it owns none.
 */
Status ComputeColumnIndices(const std::vector<FieldLayout>& layout,
                            std::vector<int32_t>* column_indices);

// Layout used by the default writer: one column per field, lists take an
// offsets column plus their child, structs marked with metadata
// "packed"="true" are one column for the whole subtree.
std::vector<FieldLayout> DefaultPhysicalLayout(const Schema& schema);

// One entry per field, no duplicate value other than -1.
Status ValidateColumnIndices(const std::vector<int32_t>& fields,
                             const std::vector<int32_t>& column_indices);

std::string ArrowTypeToLogicalType(const arrow::DataType& type);

} // namespace shale
