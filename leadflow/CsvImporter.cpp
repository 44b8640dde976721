#include "CsvImporter.h"

#if !defined(restrict)
#define restrict __restrict
#endif

extern "C" {
#include <zsv.h>
}

#include <algorithm>
#include <cctype>
#include <cstring>
#include <folly/Exception.h>
#include <folly/String.h>
#include <glog/logging.h>

using folly::StringPiece;

static StringPiece cellAt(struct zsv_scanner *zsv, size_t i) {
  struct zsv_cell cell = zsv_get_cell(zsv, i);
  return folly::trimWhitespace(
      StringPiece(reinterpret_cast<const char*>(cell.str), cell.len));
}

CsvImporter::~CsvImporter() noexcept {
  close();
}

void CsvImporter::close() noexcept {
  if (zsv_) {
    zsv_delete(zsv_);
    zsv_ = nullptr;
  }

  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }

  columns_.clear();
  numRows_ = 0;
}

CsvImporter::Field CsvImporter::fieldOf(StringPiece header) {
  std::string key;
  for (char c : header) {
    if (std::isalnum(static_cast<unsigned char>(c)))
      key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  static const struct {
    const char *alias;
    Field field;
  } aliases[] = {
    {"firstname", kFirstName}, {"first", kFirstName},
    {"lastname", kLastName}, {"last", kLastName}, {"surname", kLastName},
    {"contactname", kContactName}, {"name", kContactName}, {"fullname", kContactName},
    {"email", kEmail}, {"emailaddress", kEmail},
    {"phone", kPhone}, {"phonenumber", kPhone},
    {"company", kCompany}, {"companyname", kCompany}, {"organization", kCompany},
    {"title", kTitle}, {"jobtitle", kTitle},
    {"state", kState},
    {"source", kSource},
    {"notes", kNotes},
  };
  for (const auto &entry : aliases) {
    if (key == entry.alias)
      return entry.field;
  }
  return kIgnored;
}

PipelineResult<folly::Unit> CsvImporter::open(const char *csvPath) {
  close();

  file_ = std::fopen(csvPath, "r");
  if (!file_)
    folly::throwSystemError("cannot open ", csvPath);

  struct zsv_opts opts;
  std::memset(&opts, 0, sizeof(opts));
  opts.stream = file_;

  zsv_ = zsv_new(&opts);
  CHECK(zsv_);

  if (zsv_next_row(zsv_) != zsv_status_row) {
    return folly::makeUnexpected(PipelineError(PIPE_MALFORMED_RECORD)
        .putVariable(std::string(csvPath) + ": missing header row"));
  }

  size_t mapped = 0;
  for (size_t i = 0, n = zsv_cell_count(zsv_); i < n; ++i) {
    columns_.push_back(fieldOf(cellAt(zsv_, i)));
    if (columns_.back() != kIgnored)
      ++mapped;
  }
  if (mapped == 0) {
    return folly::makeUnexpected(PipelineError(PIPE_MALFORMED_RECORD)
        .putVariable(std::string(csvPath) + ": no known columns in header"));
  }

  VLOG(1) << csvPath << ": " << mapped << " of " << columns_.size() << " columns mapped";
  return folly::unit;
}

bool CsvImporter::nextRow() {
  if (zsv_next_row(zsv_) != zsv_status_row)
    return false;
  ++numRows_;
  return true;
}

static void splitContactName(StringPiece name, ImportRecord &record) {
  size_t space = name.find(' ');
  if (space == StringPiece::npos) {
    if (record.firstName.empty())
      record.firstName = name.str();
    return;
  }
  if (record.firstName.empty())
    record.firstName = name.subpiece(0, space).str();
  if (record.lastName.empty())
    record.lastName = folly::trimWhitespace(name.subpiece(space + 1)).str();
}

bool CsvImporter::nextRecord(ImportRecord &record) {
  CHECK(zsv_) << "CsvImporter::open() not called";

  while (nextRow()) {
    record = ImportRecord();
    StringPiece contactName;
    bool blank = true;

    size_t n = std::min<size_t>(zsv_cell_count(zsv_), columns_.size());
    for (size_t i = 0; i < n; ++i) {
      StringPiece value = cellAt(zsv_, i);
      if (value.empty())
        continue;
      blank = false;

      switch (columns_[i]) {
      case kFirstName:   record.firstName = value.str(); break;
      case kLastName:    record.lastName = value.str(); break;
      case kContactName: contactName = value; break;
      case kEmail:       record.email = value.str(); break;
      case kPhone:       record.phone = value.str(); break;
      case kCompany:     record.companyName = value.str(); break;
      case kTitle:       record.title = value.str(); break;
      case kState:       record.state = value.subpiece(0, 2).str(); break;
      case kSource:      record.source = value.str(); break;
      case kNotes:       record.notes = value.str(); break;
      case kIgnored:     break;
      }
    }

    if (blank)
      continue;

    if (!contactName.empty())
      splitContactName(contactName, record);
    std::transform(record.state.begin(), record.state.end(), record.state.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return true;
  }
  return false;
}

PipelineResult<std::vector<ImportRecord>> CsvImporter::readFile(const char *csvPath) {
  CsvImporter reader;
  auto opened = reader.open(csvPath);
  if (!opened)
    return folly::makeUnexpected(std::move(opened.error()));

  std::vector<ImportRecord> records;
  ImportRecord record;
  while (reader.nextRecord(record))
    records.push_back(std::move(record));

  LOG(INFO) << csvPath << ": " << records.size() << " records from "
            << reader.numRows() << " rows";
  return records;
}
