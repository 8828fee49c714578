#pragma once

#include <QWidget>
#include <functional>

#include "SurfaceProvider.h"

// Native child window an external terminal embeds into ("xterm -into").
// Ready once shown with a native window id.
class EmbedSurface : public QWidget, public SurfaceProvider
{
    Q_OBJECT
public:
    explicit EmbedSurface(QWidget *parent = nullptr);

    bool ready() const override;
    QString surfaceId() const override;
    void setReadyCallback(std::function<void()> cb) override;

protected:
    void showEvent(QShowEvent *event) override;

private:
    std::function<void()> m_readyCb;
};
