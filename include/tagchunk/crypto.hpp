#pragma once
#include <cstdint>
#include <vector>

namespace tagchunk {

// Seals a chunk payload so a message stored in a private chunk is
// unreadable and tamper-evident without the key.
class PayloadSealer {
public:
    virtual ~PayloadSealer() = default;
    virtual void set_key(const std::vector<uint8_t>& key) = 0;
    virtual bool seal(std::vector<uint8_t>& inout) = 0;
    virtual bool open(std::vector<uint8_t>& inout) = 0;
};

// XChaCha20-Poly1305 from libsodium. Sealed layout is nonce || ciphertext.
class SodiumSealer : public PayloadSealer {
public:
    SodiumSealer();
    bool ready() const { return ready_; }
    void set_key(const std::vector<uint8_t>& key) override;
    bool seal(std::vector<uint8_t>& inout) override;
    bool open(std::vector<uint8_t>& inout) override;

    static size_t overhead();
private:
    bool ready_ = false;
    std::vector<uint8_t> key_;
};

} // namespace tagchunk
