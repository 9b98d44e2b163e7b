#pragma once

#include <stdexcept>
#include <string>

namespace genocol {

enum class ErrorKind {
    UnknownAllele,
    TooManyAlleles,
    InvalidAlleleIndex,
    IncompatibleVariant,
    UnsupportedPloidy,
    UnsupportedMultiAllelic,
    CorruptFile,
    IndexOutOfBounds,
    InvalidValue,
    IoError
};

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownAllele: return "UnknownAllele";
        case ErrorKind::TooManyAlleles: return "TooManyAlleles";
        case ErrorKind::InvalidAlleleIndex: return "InvalidAlleleIndex";
        case ErrorKind::IncompatibleVariant: return "IncompatibleVariant";
        case ErrorKind::UnsupportedPloidy: return "UnsupportedPloidy";
        case ErrorKind::UnsupportedMultiAllelic: return "UnsupportedMultiAllelic";
        case ErrorKind::CorruptFile: return "CorruptFile";
        case ErrorKind::IndexOutOfBounds: return "IndexOutOfBounds";
        case ErrorKind::InvalidValue: return "InvalidValue";
        case ErrorKind::IoError: return "IoError";
    }
    return "Unknown";
}

/**
 * @brief Base class of every error raised by the genocol library.
 *
 * Statistics that have no defined answer for the data (too few samples,
 * all calls missing) return NaN instead of throwing.
 */
class GenotypeError : public std::runtime_error {
public:
    GenotypeError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(std::string(ErrorKindName(kind)) + ": " + msg), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Allele string not in the variant's palette.
class UnknownAllele : public GenotypeError {
public:
    explicit UnknownAllele(const std::string& msg) : GenotypeError(ErrorKind::UnknownAllele, msg) {}
};

// Palette full, or more alleles than the ploidy allows.
class TooManyAlleles : public GenotypeError {
public:
    explicit TooManyAlleles(const std::string& msg) : GenotypeError(ErrorKind::TooManyAlleles, msg) {}
};

class InvalidAlleleIndex : public GenotypeError {
public:
    explicit InvalidAlleleIndex(const std::string& msg) : GenotypeError(ErrorKind::InvalidAlleleIndex, msg) {}
};

// Genotypes or columns of different variants combined.
class IncompatibleVariant : public GenotypeError {
public:
    explicit IncompatibleVariant(const std::string& msg) : GenotypeError(ErrorKind::IncompatibleVariant, msg) {}
};

class UnsupportedPloidy : public GenotypeError {
public:
    explicit UnsupportedPloidy(const std::string& msg) : GenotypeError(ErrorKind::UnsupportedPloidy, msg) {}
};

class UnsupportedMultiAllelic : public GenotypeError {
public:
    explicit UnsupportedMultiAllelic(const std::string& msg) : GenotypeError(ErrorKind::UnsupportedMultiAllelic, msg) {}
};

// Bad magic bytes, truncated records, malformed lines.
class CorruptFile : public GenotypeError {
public:
    explicit CorruptFile(const std::string& msg) : GenotypeError(ErrorKind::CorruptFile, msg) {}
};

class IndexOutOfBounds : public GenotypeError {
public:
    explicit IndexOutOfBounds(const std::string& msg) : GenotypeError(ErrorKind::IndexOutOfBounds, msg) {}
};

// Malformed arguments and options.
class InvalidValue : public GenotypeError {
public:
    explicit InvalidValue(const std::string& msg) : GenotypeError(ErrorKind::InvalidValue, msg) {}
};

// A file could not be opened, read or written.
class IoError : public GenotypeError {
public:
    explicit IoError(const std::string& msg) : GenotypeError(ErrorKind::IoError, msg) {}
};

}  // namespace genocol
