#pragma once

#include <QString>
#include <functional>
#include <memory>

/*
    SurfaceProvider
    ---------------
    A display region an external terminal can be embedded into
    (X11 window id for "xterm -into").

    - ready():     the surface exists and has a native id
    - surfaceId(): textual id passed to the terminal (only valid when ready)
    - setReadyCallback(): optional explicit readiness notification; the
      provider invokes the callback once the surface becomes ready.
      An empty function clears it.
    - lifetime(): expires when the provider is destroyed; holders of a
      raw SurfaceProvider* check it before every call.

    Not a QObject so widget implementations can inherit QWidget.
*/

class SurfaceProvider
{
public:
    virtual ~SurfaceProvider() = default;

    virtual bool ready() const = 0;
    virtual QString surfaceId() const = 0;

    virtual void setReadyCallback(std::function<void()> cb) { Q_UNUSED(cb); }

    std::weak_ptr<void> lifetime() const { return m_lifetime; }

private:
    std::shared_ptr<void> m_lifetime = std::make_shared<char>(0);
};
