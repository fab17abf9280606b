#include "injection_scripts.h"

#include <cstdio>
#include <sstream>

namespace injection
{

std::string buildClickScript(int x, int y)
{
    std::ostringstream script;
    script << "(function() {\n"
           << "  const x = " << x << ";\n"
           << "  const y = " << y << ";\n";
    script << R"JS(  const el = document.elementFromPoint(x, y);
  if (!el) return;

  // Clicking a player toggles playback instead of clicking its overlay
  const isPlayer = el.tagName === 'VIDEO' ||
                   el.closest('.html5-video-player') || el.closest('.ytp-player') ||
                   el.closest('#movie_player') || el.closest('.html5-main-video') ||
                   el.closest('.video-stream') ||
                   (window.location.hostname.includes('youtube.com') && el.closest('#player'));
  if (isPlayer) {
    const video = el.tagName === 'VIDEO' ? el :
                  (document.querySelector('video.html5-main-video') ||
                   document.querySelector('video.video-stream') ||
                   document.querySelector('#movie_player video') ||
                   document.querySelector('video'));
    if (video) {
      if (video.paused) {
        video.play().catch(() => {});
      } else {
        video.pause();
      }
      return;
    }
  }

  let clickTarget = el;
  let current = el;
  for (let i = 0; i < 10 && current; i++) {
    if (current.tagName === 'A' || current.tagName === 'BUTTON' ||
        current.onclick || current.getAttribute('role') === 'button' ||
        window.getComputedStyle(current).cursor === 'pointer') {
      clickTarget = current;
      break;
    }
    current = current.parentElement;
  }

  const opts = {
    bubbles: true, cancelable: true, view: window,
    clientX: x, clientY: y, screenX: x, screenY: y,
    button: 0, buttons: 1, pointerId: 1, pointerType: 'mouse', isPrimary: true
  };

  const isInput = el.tagName === 'INPUT' || el.tagName === 'TEXTAREA' ||
                  el.isContentEditable ||
                  el.getAttribute('role') === 'textbox' ||
                  el.getAttribute('role') === 'searchbox' ||
                  el.closest('[contenteditable="true"]');
  if (isInput) {
    el.focus();
    el.dispatchEvent(new FocusEvent('focus', { bubbles: true }));
    el.dispatchEvent(new FocusEvent('focusin', { bubbles: true }));
    el.dispatchEvent(new MouseEvent('click', opts));
    return;
  }

  try {
    clickTarget.dispatchEvent(new PointerEvent('pointerdown', opts));
    clickTarget.dispatchEvent(new PointerEvent('pointerup', opts));
  } catch (e) {}

  clickTarget.dispatchEvent(new MouseEvent('mousedown', opts));
  clickTarget.dispatchEvent(new MouseEvent('mouseup', opts));
  clickTarget.dispatchEvent(new MouseEvent('click', opts));

  if (clickTarget.click) clickTarget.click();
})();
)JS";
    return script.str();
}

std::string buildContextMenuScript(int x, int y)
{
    std::ostringstream script;
    script << "(function() {\n"
           << "  const el = document.elementFromPoint(" << x << ", " << y << ");\n"
           << "  if (!el) return;\n"
           << "  el.dispatchEvent(new MouseEvent('contextmenu', {\n"
           << "    bubbles: true, cancelable: true, clientX: " << x << ", clientY: " << y << ", button: 2\n"
           << "  }));\n"
           << "})();\n";
    return script.str();
}

std::string buildScrollScript(int dx, int dy)
{
    std::ostringstream script;
    script << "window.scrollBy(" << dx << ", " << dy << ");";
    return script.str();
}

std::string buildTextEntryScript(const std::string& text, bool submit)
{
    std::ostringstream script;
    script << "(function() {\n"
           << "  const value = " << jsStringLiteral(text) << ";\n";
    script << R"JS(  const el = document.activeElement;
  if (!el || !(el.tagName === 'INPUT' || el.tagName === 'TEXTAREA' || el.isContentEditable)) return;

  if (el.isContentEditable) {
    el.textContent = value;
  } else {
    el.value = value;
  }
  el.dispatchEvent(new Event('input', { bubbles: true }));
  el.dispatchEvent(new Event('change', { bubbles: true }));
)JS";

    if (submit)
    {
        // Enter first; the submit button is clicked once, which fires the form's submit handlers
        script << R"JS(
  setTimeout(() => {
    for (const type of ['keydown', 'keypress', 'keyup']) {
      el.dispatchEvent(new KeyboardEvent(type, { key: 'Enter', keyCode: 13, bubbles: true }));
    }
    const form = el.closest('form');
    if (form) {
      const submitBtn = form.querySelector('button[type="submit"], input[type="submit"], button:not([type])');
      if (submitBtn) submitBtn.click();
    }
  }, 50);
)JS";
    }

    script << "})();\n";
    return script.str();
}

std::string jsStringLiteral(const std::string& text)
{
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char ch : text)
    {
        switch (ch)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20)
            {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned char>(ch));
                out += escaped;
            }
            else
            {
                // No raw '<', so a closing script tag cannot appear
                out += ch == '<' ? std::string("\\x3c") : std::string(1, ch);
            }
            break;
        }
    }
    out += '"';
    return out;
}

} // namespace injection
