#include <stagehand/project/handles.h>

#include <fmt/format.h>

#include <string_view>

namespace stagehand {

const ProjectAddress& Project::address() const { return _registry->project_record(_index).address; }

std::optional<std::string> Project::asset_url(const Asset& asset) const {
    if (!asset.id) { return std::nullopt; }
    std::string_view base{_registry->project_record(_index).config.assets.base_url};
    while (base.ends_with('/')) { base.remove_suffix(1); }
    return fmt::format("{}/{}", base, *asset.id);
}

Sheet Project::sheet(const SheetId& sheet_id, const SheetInstanceId& instance_id) const {
    return Sheet{*_registry, _registry->sheet(_index, sheet_id, instance_id)};
}

ProjectSnapshot Project::state() const { return _registry->project_record(_index).state; }

void Project::reload_state(ProjectSnapshot snapshot) const { _registry->reload_state(_index, std::move(snapshot)); }

const ProjectConfig& Project::config() const { return _registry->project_record(_index).config; }

}  // namespace stagehand
