#ifndef LEADFLOW_CSV_IMPORTER_H
#define LEADFLOW_CSV_IMPORTER_H

#include "Intake.h"

#include <cstdio>
#include <vector>

/**
 * Lead CSV reader. The first row names the columns; common spellings of
 * each field are recognized case-insensitively.
 */
class CsvImporter {
 public:
  CsvImporter() = default;
  CsvImporter(const CsvImporter &) = delete;
  CsvImporter& operator=(const CsvImporter &) = delete;
  ~CsvImporter() noexcept;

  /**
   * Open a file and map its header row. Throws std::system_error when the
   * file cannot be opened.
   */
  PipelineResult<folly::Unit> open(const char *csvPath);
  void close() noexcept;

  /** Next non-blank row. False at end of input. */
  bool nextRecord(ImportRecord &record);
  /** Data rows read so far, blank ones included. */
  size_t numRows() const noexcept { return numRows_; }

  static PipelineResult<std::vector<ImportRecord>> readFile(const char *csvPath);

 private:
  enum Field {
    kIgnored,
    kFirstName,
    kLastName,
    kContactName,
    kEmail,
    kPhone,
    kCompany,
    kTitle,
    kState,
    kSource,
    kNotes,
  };

  static Field fieldOf(folly::StringPiece header);
  bool nextRow();

  struct zsv_scanner *zsv_ = nullptr;
  FILE *file_ = nullptr;
  std::vector<Field> columns_;
  size_t numRows_ = 0;
};

#endif // LEADFLOW_CSV_IMPORTER_H
