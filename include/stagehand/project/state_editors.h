#pragma once

/**
 * @file state_editors.h
 * @brief Edits of a caller-owned ProjectSnapshot, as performed by an editing tool.
 *
 * None of these touch a live project. Apply the edited snapshot with Project::reload_state.
 */

#include <stagehand/core/ids.h>
#include <stagehand/project/snapshot.h>
#include <stagehand/stagehand_export.h>
#include <stagehand/value/path.h>
#include <stagehand/value/value.h>

#include <vector>

namespace stagehand {

/**
 * @brief Identifies one prop of one object in a snapshot.
 */
struct PropLocation {
    SheetId sheet_id;
    ObjectAddressKey object_key;
    PropPath path;
};

/**
 * @brief Give the prop an (empty) track, creating the sheet sequence when needed, and drop its static override.
 * @return the id of the prop's track; the existing one when the prop is already sequenced
 * @throws InvalidArgument for an empty path
 */
STAGEHAND_EXPORT SequenceTrackId set_primitive_prop_as_sequenced(ProjectSnapshot& snapshot,
                                                                 const PropLocation& prop);

/**
 * @brief Remove the prop's track and pin the prop to `value` as a static override.
 */
STAGEHAND_EXPORT void set_primitive_prop_as_static(ProjectSnapshot& snapshot, const PropLocation& prop,
                                                   const Value& value);

/**
 * @brief Set the value of the keyframe at `position`, inserting one when none sits exactly there.
 *
 * New keyframes get the default handles and inherit connected_right from their left neighbour.
 *
 * @return the id of the written keyframe
 * @throws InvalidArgument when the prop is not sequenced or `position` is negative or non-finite
 */
STAGEHAND_EXPORT KeyframeId set_keyframe_at_position(ProjectSnapshot& snapshot, const PropLocation& prop,
                                                     double position, const Value& value);

/**
 * @brief Remove the keyframes with the given ids from the prop's track. Unknown ids are ignored.
 * @return the number of keyframes removed
 */
STAGEHAND_EXPORT std::size_t delete_keyframes(ProjectSnapshot& snapshot, const PropLocation& prop,
                                              const std::vector<KeyframeId>& ids);

/**
 * @brief Write `value` at the prop's path in the object's static overrides.
 */
STAGEHAND_EXPORT void set_static_override(ProjectSnapshot& snapshot, const PropLocation& prop, const Value& value);

}  // namespace stagehand
