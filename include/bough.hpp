// bough.hpp - Bough - Structural Editing Core
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

//========================================================================
// Bough Core Principles:
//========================================================================
//
// The Single-Owner Principle
// --------------------------
// One arena owns every node of an edit session. Nodes refer to each other
// by handle, never by ownership, and nothing is freed until the session
// ends.
//
//
// The Valid-Tree Principle
// ------------------------
// An edit either produces a tree the grammar accepts, or it is refused
// with an error value and changes nothing. Refusal is an everyday event,
// not a crash.
//
//
// The Self-Description Principle
// ------------------------------
// A node describes its own rendering and only positions its children.
// The full document text, the highlighting and the debug outline are all
// derived from those descriptions, freshly, on every render.
//
//========================================================================


#ifndef BOUGH_STRUCTURAL_EDITING_CORE
#define BOUGH_STRUCTURAL_EDITING_CORE

#include "bough_core.hpp"
#include "bough_log.hpp"
#include "bough_arena.hpp"
#include "bough_tokens.hpp"
#include "bough_size.hpp"
#include "bough_ast.hpp"
#include "bough_style.hpp"
#include "bough_render.hpp"
#include "bough_editor.hpp"
#include "bough_json.hpp"

#endif
