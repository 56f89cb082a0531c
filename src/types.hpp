#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs (ScreenPos/ViewportConfig).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

struct ScreenPos { int row = 0; int col = 0; };

/* rows: text body rows (header excluded); cols: terminal width. */
struct ViewportConfig { int rows = 1; int cols = 1; };
