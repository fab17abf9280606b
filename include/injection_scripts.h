#ifndef INJECTION_SCRIPTS_H
#define INJECTION_SCRIPTS_H

#include <string>

namespace injection
{

/**
 * @brief Primary click at surface-relative (x, y)
 *
 * Text-input-like elements are focused and clicked. Anything else walks up to
 * ten ancestors looking for a clickable element, receives the pointer and
 * mouse event sequence, then a direct click() as fallback.
 */
std::string buildClickScript(int x, int y);

/**
 * @brief Secondary click: a contextmenu event on the topmost element at (x, y)
 */
std::string buildContextMenuScript(int x, int y);

std::string buildScrollScript(int dx, int dy);

/**
 * @brief Set the value of the surface's active input, optionally submitting it
 */
std::string buildTextEntryScript(const std::string& text, bool submit);

/**
 * @brief Quote text as a JavaScript string literal
 */
std::string jsStringLiteral(const std::string& text);

} // namespace injection

#endif // INJECTION_SCRIPTS_H
