#pragma once
/*
 * Renderer
 *
 * Purpose: draw the header (title + separator), the visible slice of the
 *          buffer and place the caret.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; scrolling is owned by Window, not recomputed here.
 */
#include "iterminal.hpp"

class Window;

class Renderer {
public:
  void render(ITerminal& term, const Window& win);
};
