#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight enums/structs used by commands and terminals.
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

enum class ClearType { All, FromCursorDown, FromCursorUp, CurrentLine, UntilNewLine };

struct CursorPos { int row = 0; int col = 0; };
