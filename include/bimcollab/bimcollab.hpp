/// @file bimcollab.hpp
/// @brief Umbrella header for the bimcollab library.
///
/// Include this single header for access to all public types:
/// Engine, SessionStore, Session, Change, Conflict, Version,
/// EngineConfig, permissions and errors.

#pragma once

#include <bimcollab/change.hpp>
#include <bimcollab/config.hpp>
#include <bimcollab/conflict.hpp>
#include <bimcollab/engine.hpp>
#include <bimcollab/error.hpp>
#include <bimcollab/journal.hpp>
#include <bimcollab/permissions.hpp>
#include <bimcollab/session.hpp>
#include <bimcollab/session_store.hpp>
#include <bimcollab/types.hpp>
#include <bimcollab/value.hpp>
#include <bimcollab/version.hpp>
