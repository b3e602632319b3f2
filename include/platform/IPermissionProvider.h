#ifndef IPERMISSIONPROVIDER_H
#define IPERMISSIONPROVIDER_H

/**
 * @brief Query and request the OS permissions element capture needs.
 *
 * Query methods are safe to call from any thread. Request methods hand
 * off to the platform's own consent flow and return immediately.
 */
class IPermissionProvider
{
public:
    virtual ~IPermissionProvider() = default;

    virtual bool isAccessibilityGranted() const = 0;
    virtual bool isScreenRecordingGranted() const = 0;
    virtual void requestAccessibility() = 0;
    virtual void requestScreenRecording() = 0;
};

#endif // IPERMISSIONPROVIDER_H
