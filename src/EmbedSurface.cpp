// EmbedSurface.cpp
#include "EmbedSurface.h"

#include <QPalette>
#include <QShowEvent>
#include <QTimer>

EmbedSurface::EmbedSurface(QWidget *parent)
    : QWidget(parent)
{
    setAttribute(Qt::WA_NativeWindow, true);
    setAttribute(Qt::WA_DontCreateNativeAncestors, true);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumHeight(160);

    QPalette pal = palette();
    pal.setColor(QPalette::Window, Qt::black);
    setPalette(pal);
    setAutoFillBackground(true);
}

bool EmbedSurface::ready() const
{
    return isVisible() && internalWinId() != 0;
}

QString EmbedSurface::surfaceId() const
{
    return QString::number(static_cast<qulonglong>(internalWinId()));
}

void EmbedSurface::setReadyCallback(std::function<void()> cb)
{
    m_readyCb = std::move(cb);
    if (m_readyCb && ready())
        QTimer::singleShot(0, this, [this]() { if (m_readyCb) m_readyCb(); });
}

void EmbedSurface::showEvent(QShowEvent *event)
{
    QWidget::showEvent(event);
    (void)winId();   // realize the native window
    if (m_readyCb)
        m_readyCb();
}
