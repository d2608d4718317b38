#pragma once

/**
@file
@brief Includes every public header of the preview runtime.
*/

#include <vitrine/core/types.hpp>

#include <vitrine/message/any_message.hpp>
#include <vitrine/message/message.hpp>

#include <vitrine/runtime/element.hpp>
#include <vitrine/runtime/task.hpp>

#include <vitrine/preview/history.hpp>
#include <vitrine/preview/metadata.hpp>
#include <vitrine/preview/performance.hpp>
#include <vitrine/preview/preview.hpp>
#include <vitrine/preview/stateful.hpp>
#include <vitrine/preview/stateless.hpp>
#include <vitrine/preview/timeline.hpp>

#include <vitrine/dynamic/dynamic.hpp>
#include <vitrine/dynamic/extract_params.hpp>
#include <vitrine/dynamic/param.hpp>
#include <vitrine/dynamic/stateful.hpp>
#include <vitrine/dynamic/stateless.hpp>
#include <vitrine/dynamic/value.hpp>

#include <vitrine/registry/registry.hpp>
