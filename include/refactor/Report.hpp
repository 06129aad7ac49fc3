#pragma once
#include "refactor/Operation.hpp"

#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <vector>

namespace refsafe {

// Files an operation actually touched (renamed or rewritten without error).
unsigned processedCount(const std::vector<RenameResult>& results);
bool anyFailed(const std::vector<RenameResult>& results);

// One line per record, "  LABEL: subject (detail)".
void printOperations(llvm::raw_ostream& os, const std::vector<OperationRecord>& records);

// Counts by kind, then the total.
void printSummary(llvm::raw_ostream& os, const std::vector<OperationRecord>& records);

// {processed, success, operations:[{kind,subject,detail}],
//  files:[{path,new_path,backend,changes,error,compile}]}
llvm::json::Value toJson(const std::vector<RenameResult>& results,
                         const std::vector<OperationRecord>& records, bool success);

void printJson(llvm::raw_ostream& os, const std::vector<RenameResult>& results,
               const std::vector<OperationRecord>& records, bool success);

} // namespace refsafe
