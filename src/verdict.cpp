#include "verdict.hpp"
#include "checksum.hpp"

const char* verdict_label(Verdict verdict){
  switch(verdict){
    case Verdict::Ok:                  return "CSUM OK";
    case Verdict::Corrupted:           return "CSUM CORRUPTED";
    case Verdict::Unverifiable:        return "CSUM UNVERIFIABLE";
    case Verdict::RegistryUnreachable: return "REGISTRY UNREACHABLE";
  }
  return "REGISTRY UNREACHABLE";
}

void classify_transfer(TransferReport& report, const QueryResult& query){
  if(query.status != RegistryStatus::Ok){
    report.verdict = Verdict::RegistryUnreachable;
    report.detail = std::string("registry ") + registry_status_name(query.status);
    if(!query.error.empty()) report.detail += ": " + query.error;
    return;
  }

  if(!query.reply.found){
    report.verdict = Verdict::Unverifiable;
    report.detail = "no live checksum registered for '" + report.file_id + "'";
    return;
  }

  report.expected_md5 = query.reply.checksum;
  report.expected_length = query.reply.length;
  if(digests_equal(report.expected_md5, report.local_md5)){
    report.verdict = Verdict::Ok;
    report.detail = "md5 " + report.local_md5;
  } else {
    report.verdict = Verdict::Corrupted;
    report.detail = "expected md5 " + report.expected_md5 + ", received " + report.local_md5;
  }
  if(report.expected_length != report.bytes_received){
    report.detail += " (registered length " + std::to_string(report.expected_length) +
                     ", received " + std::to_string(report.bytes_received) + ")";
  }
}
