// jbsync.hpp - JBeam Sync
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// JBeam Sync Core Principles:
//========================================================================
//
// The Authored-Text Principle
// ---------------------------
// The text a person wrote is the source of truth.
// Comments, spacing, number precision and row layout survive every edit.
// Only the tokens that must change are touched.
//
//
// The Atomic-Cycle Principle
// --------------------------
// An export cycle computes everything on private copies first.
// It then either rewrites the text fully or leaves it untouched.
//
//
// The Ask-Before-Merging Principle
// --------------------------------
// A new node on top of an existing one is never merged silently.
// The cycle stops and waits for a decision.
//
//========================================================================

#ifndef JBSYNC_JBEAM_SYNC
#define JBSYNC_JBEAM_SYNC

#include "jbsync_core.hpp"
#include "jbsync_log.hpp"
#include "jbsync_tokens.hpp"
#include "jbsync_value.hpp"
#include "jbsync_patcher.hpp"
#include "jbsync_symmetry.hpp"
#include "jbsync_config.hpp"
#include "jbsync_entities.hpp"
#include "jbsync_geometry.hpp"
#include "jbsync_table_editor.hpp"
#include "jbsync_reconciler.hpp"
#include "jbsync_gate.hpp"
#include "jbsync_session.hpp"

#endif
