#ifndef CONTENT_SURFACE_H
#define CONTENT_SURFACE_H

#include "geometry.h"

#include <functional>
#include <optional>
#include <string>

/**
 * @brief Completion of an injected script; error is empty when ok
 */
using ScriptCompletion = std::function<void(bool ok, const std::string& error)>;

/**
 * @brief Embedded third-party content the host can only drive through scripts
 */
class ContentSurface
{
public:
    virtual ~ContentSurface() = default;

    virtual bool isReady() const = 0;

    virtual bool canGoBack() const = 0;
    virtual void goBack() = 0;
    virtual bool canGoForward() const = 0;
    virtual void goForward() = 0;

    virtual std::string currentUrl() const = 0;

    /**
     * @brief Evaluate a script inside the surface
     *
     * Completion may run later, on a future tick. Implementations may also
     * throw when the surface cannot accept scripts at all.
     */
    virtual void executeScript(const std::string& script, ScriptCompletion completion) = 0;
};

/**
 * @brief Owns the (at most one) content surface and its container
 */
class ContentHost
{
public:
    virtual ~ContentHost() = default;

    /**
     * @brief Create the surface if needed and load url into it
     * @return The active surface, or nullptr when it could not be created
     */
    virtual ContentSurface* open(const std::string& url) = 0;

    virtual void destroy() = 0;
    virtual ContentSurface* current() = 0;
    virtual void setVisible(bool visible) = 0;

    /**
     * @brief Bounding box of the content container, if it is laid out
     */
    virtual std::optional<Rect> containerBounds() const = 0;

    virtual Rect viewport() const = 0;

    /**
     * @brief Called when an editable element inside the surface gains focus
     */
    virtual void setInputFocusedCallback(std::function<void()> callback) = 0;
};

#endif // CONTENT_SURFACE_H
