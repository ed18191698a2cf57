// -----------------------------------------------------------------------------
// protocol.cpp - mode catalog and kind bit helpers
//
// API & constants: include/lanmsg/protocol.hpp
// -----------------------------------------------------------------------------
#include "lanmsg/protocol.hpp"

#include <stdio.h>
#include <vector>

namespace lanmsg {

// ---------- bits ----------

namespace bits {

bool requests_ack(uint32_t kind) {
  // SENDCHECK aliases ABSENCE; only meaningful on a text message
  return classify(kind) == Mode::SendMsg && has_option(kind, opt::SENDCHECK);
}

bool is_absent(uint32_t kind) {
  return is_presence(classify(kind)) && has_option(kind, opt::ABSENCE);
}

} // namespace bits

// ---------- catalog ----------

Mode classify(uint32_t kind) {
  const uint8_t raw = bits::mode(kind);
  switch (raw) {
    case 0x00: return Mode::NoOperation;
    case 0x01: return Mode::BrEntry;
    case 0x02: return Mode::BrExit;
    case 0x03: return Mode::AnsEntry;
    case 0x04: return Mode::BrAbsence;
    case 0x10: return Mode::BrIsGetList;
    case 0x11: return Mode::OkGetList;
    case 0x12: return Mode::GetList;
    case 0x13: return Mode::AnsList;
    case 0x18: return Mode::BrIsGetList2;
    case 0x20: return Mode::SendMsg;
    case 0x21: return Mode::RecvMsg;
    case 0x30: return Mode::ReadMsg;
    case 0x31: return Mode::DelMsg;
    case 0x32: return Mode::AnsReadMsg;
    case 0x40: return Mode::GetInfo;
    case 0x41: return Mode::SendInfo;
    case 0x50: return Mode::GetAbsenceInfo;
    case 0x51: return Mode::SendAbsenceInfo;
    case 0x60: return Mode::GetFileData;
    case 0x61: return Mode::ReleaseFiles;
    case 0x62: return Mode::GetDirFiles;
    case 0x72: return Mode::GetPubKey;
    case 0x73: return Mode::AnsPubKey;
    default:   return Mode::Unknown;
  }
}

bool is_presence(Mode m) {
  return m == Mode::BrEntry || m == Mode::BrExit ||
         m == Mode::AnsEntry || m == Mode::BrAbsence;
}

const char* mode_name(uint32_t kind) {
  switch (classify(kind)) {
    case Mode::NoOperation:     return "IPMSG_NOOPERATION";
    case Mode::BrEntry:         return "IPMSG_BR_ENTRY";
    case Mode::BrExit:          return "IPMSG_BR_EXIT";
    case Mode::AnsEntry:        return "IPMSG_ANSENTRY";
    case Mode::BrAbsence:       return "IPMSG_BR_ABSENCE";
    case Mode::BrIsGetList:     return "IPMSG_BR_ISGETLIST";
    case Mode::OkGetList:       return "IPMSG_OKGETLIST";
    case Mode::GetList:         return "IPMSG_GETLIST";
    case Mode::AnsList:         return "IPMSG_ANSLIST";
    case Mode::BrIsGetList2:    return "IPMSG_BR_ISGETLIST2";
    case Mode::SendMsg:         return "IPMSG_SENDMSG";
    case Mode::RecvMsg:         return "IPMSG_RECVMSG";
    case Mode::ReadMsg:         return "IPMSG_READMSG";
    case Mode::DelMsg:          return "IPMSG_DELMSG";
    case Mode::AnsReadMsg:      return "IPMSG_ANSREADMSG";
    case Mode::GetInfo:         return "IPMSG_GETINFO";
    case Mode::SendInfo:        return "IPMSG_SENDINFO";
    case Mode::GetAbsenceInfo:  return "IPMSG_GETABSENCEINFO";
    case Mode::SendAbsenceInfo: return "IPMSG_SENDABSENCEINFO";
    case Mode::GetFileData:     return "IPMSG_GETFILEDATA";
    case Mode::ReleaseFiles:    return "IPMSG_RELEASEFILES";
    case Mode::GetDirFiles:     return "IPMSG_GETDIRFILES";
    case Mode::GetPubKey:       return "IPMSG_GETPUBKEY";
    case Mode::AnsPubKey:       return "IPMSG_ANSPUBKEY";
    case Mode::Unknown:         return "UNKNOWN";
  }
  return "UNKNOWN";
}

// explain() - name, raw value, mode byte, then flags.
// POLICY: global flags are always listed; send-context flags only when the
// mode is a text message, since they alias the global bits elsewhere.
std::string explain(uint32_t kind) {
  struct Named { uint32_t flag; const char* name; };
  static const Named GLOBAL[] = {
    {opt::FILEATTACH, "FILEATTACH"},
    {opt::UTF8,       "UTF8"},
    {opt::ENCRYPT,    "ENCRYPT"},
    {opt::DIALUP,     "DIALUP"},
  };
  static const Named PRESENCE[] = {
    {opt::ABSENCE, "ABSENCE"},
    {opt::SERVER,  "SERVER"},
  };
  static const Named SEND[] = {
    {opt::SENDCHECK, "SENDCHECK"},
    {opt::SECRET,    "SECRET"},
    {opt::BROADCAST, "BROADCAST"},
    {opt::MULTICAST, "MULTICAST"},
    {opt::NOPOPUP,   "NOPOPUP"},
    {opt::AUTORET,   "AUTORET"},
    {opt::RETRY,     "RETRY"},
    {opt::PASSWORD,  "PASSWORD"},
    {opt::NOLOG,     "NOLOG"},
  };

  std::vector<const char*> flags;
  for (const auto& n : GLOBAL) if (bits::has_option(kind, n.flag)) flags.push_back(n.name);

  const Mode m = classify(kind);
  if (is_presence(m)) {
    for (const auto& n : PRESENCE) if (bits::has_option(kind, n.flag)) flags.push_back(n.name);
  } else if (m == Mode::SendMsg) {
    for (const auto& n : SEND) if (bits::has_option(kind, n.flag)) flags.push_back(n.name);
  }

  char head[64];
  snprintf(head, sizeof(head), " (0x%08X = mode: 0x%02X",
           static_cast<unsigned>(kind), static_cast<unsigned>(bits::mode(kind)));

  std::string out = mode_name(kind);
  out += head;
  if (!flags.empty()) {
    out += " | [";
    for (size_t i = 0; i < flags.size(); ++i) {
      if (i) out += " | ";
      out += flags[i];
    }
    out += "]";
  }
  out += ")";
  return out;
}

} // namespace lanmsg
