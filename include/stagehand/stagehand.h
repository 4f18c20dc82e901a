#pragma once

/**
 * @file stagehand.h
 * @brief Everything an embedding application needs.
 */

#include <stagehand/core/address.h>
#include <stagehand/core/ids.h>
#include <stagehand/project/handles.h>
#include <stagehand/project/project_config.h>
#include <stagehand/project/snapshot.h>
#include <stagehand/project/state_editors.h>
#include <stagehand/prop_types/color.h>
#include <stagehand/prop_types/prop_type.h>
#include <stagehand/prop_types/types.h>
#include <stagehand/reactive/atom.h>
#include <stagehand/reactive/pointer.h>
#include <stagehand/reactive/prism.h>
#include <stagehand/reactive/ticker.h>
#include <stagehand/runtime/core_config.h>
#include <stagehand/runtime/core_context.h>
#include <stagehand/runtime/frame_loop.h>
#include <stagehand/runtime/raf_driver.h>
#include <stagehand/sequence/audio_sync.h>
#include <stagehand/sequence/bezier.h>
#include <stagehand/sequence/keyframe.h>
#include <stagehand/sequence/playback_completion.h>
#include <stagehand/sequence/playback_controller.h>
#include <stagehand/sequence/track_sampler.h>
#include <stagehand/util/errors.h>
#include <stagehand/util/log.h>
#include <stagehand/value/path.h>
#include <stagehand/value/value.h>
