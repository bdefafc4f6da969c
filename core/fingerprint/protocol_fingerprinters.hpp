#pragma once

#include <string>

#include "fingerprinter.hpp"

namespace sonar {
namespace fingerprint {

// Service names shared with the device classifier tables
namespace service {
constexpr const char *kHttp = "HTTP";
constexpr const char *kHttps = "HTTPS";
constexpr const char *kMqtts = "MQTTS";
constexpr const char *kSsh = "SSH";
constexpr const char *kFtp = "FTP";
constexpr const char *kSmb = "SMB";
constexpr const char *kRtsp = "RTSP";
constexpr const char *kMqtt = "MQTT";
constexpr const char *kTelnet = "Telnet";
constexpr const char *kVnc = "VNC";
constexpr const char *kRdp = "RDP";
constexpr const char *kIpp = "IPP";
constexpr const char *kJetDirect = "JetDirect";
constexpr const char *kLpd = "LPD";
constexpr const char *kSnmp = "SNMP";
constexpr const char *kDns = "DNS";
constexpr const char *kUnknown = "Unknown";
}  // namespace service

// HEAD + bounded GET, keyword hints, API suffix probes, ONVIF device call
class HttpFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "http"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

// Raw ClientHello to confirm TLS, then an HTTPS pass for hints when possible
class TlsFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "tls"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;

    static std::string client_hello();
    static bool looks_like_tls_reply(const std::string &reply);
};

class IppFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "ipp"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

class SshFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "ssh"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

class FtpFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "ftp"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

class SmbFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "smb"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;

    static std::string negotiate_request();
};

class RtspFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "rtsp"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

class MqttFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "mqtt"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;

    static std::string connect_packet();
};

class TelnetFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "telnet"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

class VncFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "vnc"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

class RdpFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "rdp"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;

    static std::string connection_request();
};

class JetDirectFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "jetdirect"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

class LpdFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "lpd"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

class SnmpFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "snmp"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;

    // sysDescr.0 value from a GetResponse, if present
    static std::optional<std::string> parse_sys_descr(const std::string &reply);
};

class DnsFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "dns"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

// Fallback for TCP ports no specific fingerprinter confirmed
class BannerFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "banner"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override;
};

}  // namespace fingerprint
}  // namespace sonar
