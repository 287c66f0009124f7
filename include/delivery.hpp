#pragma once

#include <string>

namespace talkpaste {

// Receives the final corrected text. Never called with an empty string.
class DeliveryGateway {
public:
    virtual ~DeliveryGateway() = default;
    virtual bool deliver(const std::string& text) = 0;
};

// Copies to the clipboard and, when auto_paste is set, synthesizes Ctrl+V
class ClipboardDelivery : public DeliveryGateway {
public:
    ClipboardDelivery(bool auto_paste = true, int paste_delay_ms = 50);

    bool deliver(const std::string& text) override;

private:
    bool auto_paste_;
    int paste_delay_ms_;
};

} // namespace talkpaste
