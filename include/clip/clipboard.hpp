#pragma once
#include <string>

namespace clip
{

class IClipboard
{
  public:
    virtual ~IClipboard() = default;

    virtual bool        get(std::string &out)      = 0;
    virtual bool        set(const std::string &in) = 0;
    virtual std::string name() const { return ""; }
};

// Process-local clipboard, for tests and headless use
class MemoryClipboard : public IClipboard
{
  public:
    bool get(std::string &out) override
    {
        out = contents_;
        return true;
    }
    bool set(const std::string &in) override
    {
        contents_ = in;
        return true;
    }
    std::string name() const override { return "memory"; }

  private:
    std::string contents_;
};

// True when `s` can travel as a D-Bus string: valid UTF-8 without NUL bytes.
bool is_dbus_string(const std::string &s);

// Desktop clipboard through the clipboard manager's D-Bus service
// (org.kde.klipper on the user session bus). Only text is accepted: set()
// refuses contents that are not a D-Bus string.
class KlipperClipboard final : public IClipboard
{
  public:
    bool        get(std::string &out) override;
    bool        set(const std::string &in) override;
    std::string name() const override { return "klipper"; }
};

}  // namespace clip
