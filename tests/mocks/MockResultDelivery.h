#ifndef MOCKRESULTDELIVERY_H
#define MOCKRESULTDELIVERY_H

#include "capture/ResultDelivery.h"

class MockImageClipboard : public IImageClipboard
{
public:
    void setImage(const QImage &image) override
    {
        m_calls++;
        m_image = image;
    }

    int callCount() const { return m_calls; }
    QImage image() const { return m_image; }

private:
    int m_calls = 0;
    QImage m_image;
};

class MockPreviewPresenter : public IPreviewPresenter
{
public:
    void showPreview(const QImage &image, int durationMs) override
    {
        m_calls++;
        m_image = image;
        m_durationMs = durationMs;
    }

    int callCount() const { return m_calls; }
    QImage image() const { return m_image; }
    int durationMs() const { return m_durationMs; }

private:
    int m_calls = 0;
    QImage m_image;
    int m_durationMs = 0;
};

class MockCaptureSound : public ICaptureSound
{
public:
    void play() override { m_calls++; }

    int callCount() const { return m_calls; }

private:
    int m_calls = 0;
};

#endif // MOCKRESULTDELIVERY_H
