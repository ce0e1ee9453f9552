#include <shale/schema.h>

#include <algorithm>
#include <functional>
#include <set>
#include <sstream>
#include <arrow/api.h>

namespace shale {

namespace {

std::string TimeUnitName(arrow::TimeUnit::type unit) {
    switch (unit) {
        case arrow::TimeUnit::SECOND: return "s";
        case arrow::TimeUnit::MILLI:  return "ms";
        case arrow::TimeUnit::MICRO:  return "us";
        case arrow::TimeUnit::NANO:   return "ns";
    }
    return "?";
}

bool IsPacked(const Field& field) {
    auto it = field.metadata.find("packed");
    return it != field.metadata.end() && (it->second == "true" || it->second == "1");
}

std::map<std::string, std::string> ToMap(
    const std::shared_ptr<const arrow::KeyValueMetadata>& metadata) {
    std::map<std::string, std::string> result;
    if (!metadata) return result;
    for (int64_t i = 0; i < metadata->size(); ++i) {
        result[metadata->key(i)] = metadata->value(i);
    }
    return result;
}

Field FromArrowField(const arrow::Field& arrow_field) {
    Field field;
    field.name = arrow_field.name();
    field.logical_type = ArrowTypeToLogicalType(*arrow_field.type());
    field.nullable = arrow_field.nullable();
    field.metadata = ToMap(arrow_field.metadata());

    const auto& type = arrow_field.type();
    bool fsl_of_primitive = type->id() == arrow::Type::FIXED_SIZE_LIST &&
                            type->field(0)->type()->num_fields() == 0;
    if (!fsl_of_primitive) {
        for (const auto& child : type->fields()) {
            field.children.push_back(FromArrowField(*child));
        }
    }
    return field;
}

template <typename FieldT, typename Fn>
void VisitPreOrder(std::vector<FieldT>& fields, Fn&& fn) {
    for (auto& field : fields) {
        fn(field);
        VisitPreOrder(field.children, fn);
    }
}

void AssignRecursive(std::vector<Field>& fields, int32_t parent_id, int32_t* next_id,
                     std::vector<int32_t>* assigned) {
    for (auto& field : fields) {
        if (field.id == kUnassignedFieldId) {
            field.id = (*next_id)++;
            assigned->push_back(field.id);
        }
        field.parent_id = parent_id;
        AssignRecursive(field.children, field.id, next_id, assigned);
    }
}

void LayoutRecursive(const std::vector<Field>& fields, bool inside_packed,
                     std::vector<FieldLayout>* layout) {
    for (const auto& field : fields) {
        FieldLayout entry;
        entry.field_id = field.id;
        entry.num_columns = inside_packed ? 0 : 1;
        layout->push_back(entry);
        LayoutRecursive(field.children, inside_packed || IsPacked(field), layout);
    }
}

} // namespace

std::string ArrowTypeToLogicalType(const arrow::DataType& type) {
    switch (type.id()) {
        case arrow::Type::NA: return "null";
        case arrow::Type::BOOL: return "bool";
        case arrow::Type::INT8: return "int8";
        case arrow::Type::UINT8: return "uint8";
        case arrow::Type::INT16: return "int16";
        case arrow::Type::UINT16: return "uint16";
        case arrow::Type::INT32: return "int32";
        case arrow::Type::UINT32: return "uint32";
        case arrow::Type::INT64: return "int64";
        case arrow::Type::UINT64: return "uint64";
        case arrow::Type::HALF_FLOAT: return "halffloat";
        case arrow::Type::FLOAT: return "float";
        case arrow::Type::DOUBLE: return "double";
        case arrow::Type::STRING: return "string";
        case arrow::Type::LARGE_STRING: return "large_string";
        case arrow::Type::BINARY: return "binary";
        case arrow::Type::LARGE_BINARY: return "large_binary";
        case arrow::Type::DATE32: return "date32:day";
        case arrow::Type::DATE64: return "date64:ms";
        case arrow::Type::TIMESTAMP: {
            const auto& ts = static_cast<const arrow::TimestampType&>(type);
            return "timestamp:" + TimeUnitName(ts.unit()) + ":" +
                   (ts.timezone().empty() ? "-" : ts.timezone());
        }
        case arrow::Type::DECIMAL128: {
            const auto& dec = static_cast<const arrow::Decimal128Type&>(type);
            return "decimal:128:" + std::to_string(dec.precision()) + ":" +
                   std::to_string(dec.scale());
        }
        case arrow::Type::FIXED_SIZE_BINARY: {
            const auto& fsb = static_cast<const arrow::FixedSizeBinaryType&>(type);
            return "fixed_size_binary:" + std::to_string(fsb.byte_width());
        }
        case arrow::Type::STRUCT: return "struct";
        case arrow::Type::LIST: return "list";
        case arrow::Type::LARGE_LIST: return "large_list";
        case arrow::Type::MAP: return "map";
        case arrow::Type::FIXED_SIZE_LIST: {
            const auto& fsl = static_cast<const arrow::FixedSizeListType&>(type);
            return "fixed_size_list:" + ArrowTypeToLogicalType(*fsl.value_type()) + ":" +
                   std::to_string(fsl.list_size());
        }
        default:
            return type.ToString();
    }
}

Schema::Schema(std::vector<Field> fields, std::map<std::string, std::string> metadata)
    : fields_(std::move(fields)), metadata_(std::move(metadata)) {}

Status Schema::FromArrow(const arrow::Schema& arrow_schema, Schema* schema) {
    if (arrow_schema.num_fields() == 0) {
        return Status::InvalidArgument("Schema has no fields");
    }
    std::vector<Field> fields;
    std::set<std::string> names;
    for (const auto& arrow_field : arrow_schema.fields()) {
        if (!names.insert(arrow_field->name()).second) {
            return Status::InvalidArgument("Duplicate field name: " + arrow_field->name());
        }
        fields.push_back(FromArrowField(*arrow_field));
    }
    *schema = Schema(std::move(fields), ToMap(arrow_schema.metadata()));
    return Status::OK();
}

std::vector<const Field*> Schema::AllFields() const {
    std::vector<const Field*> result;
    std::function<void(const std::vector<Field>&)> walk = [&](const std::vector<Field>& fields) {
        for (const auto& field : fields) {
            result.push_back(&field);
            walk(field.children);
        }
    };
    walk(fields_);
    return result;
}

std::vector<int32_t> Schema::FieldIds() const {
    std::vector<int32_t> ids;
    for (const Field* field : AllFields()) {
        ids.push_back(field->id);
    }
    return ids;
}

int32_t Schema::MaxFieldId() const {
    int32_t max_id = -1;
    for (const Field* field : AllFields()) {
        max_id = std::max(max_id, field->id);
    }
    return max_id;
}

const Field* Schema::FieldById(int32_t id) const {
    for (const Field* field : AllFields()) {
        if (field->id == id) return field;
    }
    return nullptr;
}

Field* Schema::MutableFieldById(int32_t id) {
    Field* found = nullptr;
    VisitPreOrder(fields_, [&](Field& field) {
        if (!found && field.id == id) found = &field;
    });
    return found;
}

const Field* Schema::FieldByPath(const std::string& path) const {
    const std::vector<Field>* level = &fields_;
    const Field* current = nullptr;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        current = nullptr;
        for (const auto& field : *level) {
            if (field.name == part) {
                current = &field;
                break;
            }
        }
        if (!current) return nullptr;
        level = &current->children;
    }
    return current;
}

Status Schema::Validate() const {
    std::set<int32_t> seen;
    for (const Field* field : AllFields()) {
        if (field->id < 0) {
            return Status::InvariantViolation("Field '" + field->name + "' has no assigned id");
        }
        if (!seen.insert(field->id).second) {
            return Status::InvariantViolation("Duplicate field id " + std::to_string(field->id));
        }
    }
    return Status::OK();
}

bool Schema::operator==(const Schema& other) const {
    std::function<bool(const std::vector<Field>&, const std::vector<Field>&)> equal =
        [&](const std::vector<Field>& a, const std::vector<Field>& b) {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (a[i].name != b[i].name || a[i].id != b[i].id ||
                    a[i].parent_id != b[i].parent_id || a[i].logical_type != b[i].logical_type ||
                    a[i].nullable != b[i].nullable || a[i].metadata != b[i].metadata ||
                    !equal(a[i].children, b[i].children)) {
                    return false;
                }
            }
            return true;
        };
    return metadata_ == other.metadata_ && equal(fields_, other.fields_);
}

std::vector<int32_t> AssignFieldIds(Schema* schema, int32_t current_max_field_id) {
    std::vector<Field> fields = schema->fields();
    std::vector<int32_t> assigned;
    int32_t next_id = current_max_field_id + 1;
    AssignRecursive(fields, -1, &next_id, &assigned);
    *schema = Schema(std::move(fields), schema->metadata());
    return assigned;
}

Status ComputeColumnIndices(const std::vector<FieldLayout>& layout,
                            std::vector<int32_t>* column_indices) {
    column_indices->clear();
    column_indices->reserve(layout.size());
    int32_t next_column = 0;
    for (const auto& entry : layout) {
        if (entry.num_columns < 0) {
            return Status::InvalidArgument("Negative column count for field " +
                                           std::to_string(entry.field_id));
        }
        if (entry.num_columns == 0) {
            column_indices->push_back(-1);
        } else {
            column_indices->push_back(next_column);
            next_column += entry.num_columns;
        }
    }
    return Status::OK();
}

std::vector<FieldLayout> DefaultPhysicalLayout(const Schema& schema) {
    std::vector<FieldLayout> layout;
    LayoutRecursive(schema.fields(), false, &layout);
    return layout;
}

Status ValidateColumnIndices(const std::vector<int32_t>& fields,
                             const std::vector<int32_t>& column_indices) {
    if (column_indices.empty()) {
        return Status::OK();
    }
    if (column_indices.size() != fields.size()) {
        return Status::InvariantViolation(
            "column_indices has " + std::to_string(column_indices.size()) +
            " entries for " + std::to_string(fields.size()) + " fields");
    }
    std::set<int32_t> seen;
    for (int32_t index : column_indices) {
        if (index == -1) continue;
        if (index < -1) {
            return Status::InvariantViolation("Invalid column index " + std::to_string(index));
        }
        if (!seen.insert(index).second) {
            return Status::InvariantViolation("Duplicate column index " + std::to_string(index));
        }
    }
    return Status::OK();
}

} // namespace shale
