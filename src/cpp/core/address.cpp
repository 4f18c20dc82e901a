#include <stagehand/core/address.h>
#include <stagehand/util/errors.h>

#include <cctype>

namespace stagehand {

namespace {

bool has_surrounding_whitespace(std::string_view text) {
    return !text.empty() &&
           (std::isspace(static_cast<unsigned char>(text.front())) || std::isspace(static_cast<unsigned char>(text.back())));
}

}  // namespace

void validate_name(std::string_view name, std::string_view context) {
    if (name.empty()) {
        throw_error<InvalidArgument>("{} cannot be an empty string.", context);
    }
    if (has_surrounding_whitespace(name)) {
        throw_error<InvalidArgument>("{} should not have surrounding whitespace. '{}' given.", context, name);
    }
    if (name.size() > MAX_NAME_LENGTH) {
        throw_error<InvalidArgument>("{} should be at most {} characters long. '{}' has {}.", context, MAX_NAME_LENGTH,
                                     name, name.size());
    }
}

void validate_project_id(std::string_view id) {
    if (has_surrounding_whitespace(id)) {
        throw_error<InvalidArgument>("Argument 'projectId' in project(\"{}\") should not have surrounding whitespace.", id);
    }
    if (id.size() < MIN_PROJECT_ID_LENGTH) {
        throw_error<InvalidArgument>("Argument 'projectId' in project(\"{}\") should be at least {} characters long.", id,
                                     MIN_PROJECT_ID_LENGTH);
    }
    validate_name(id, "Argument 'projectId'");
}

std::string to_string(const ProjectAddress& address) {
    return fmt::format("{}", address.project_id);
}

std::string to_string(const SheetAddress& address) {
    return fmt::format("{}/{}#{}", address.project_id, address.sheet_id, address.sheet_instance_id);
}

std::string to_string(const SheetObjectAddress& address) {
    return fmt::format("{}/{}#{}/{}", address.project_id, address.sheet_id, address.sheet_instance_id, address.object_key);
}

std::string to_string(const PropAddress& address) {
    return fmt::format("{}/{}#{}/{}:{}", address.project_id, address.sheet_id, address.sheet_instance_id,
                       address.object_key, address.path_to_prop);
}

}  // namespace stagehand
