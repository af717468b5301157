#pragma once

/**
 * @file errors.hpp
 * @brief Exception types raised by the conversion pipeline
 *
 * Every failure is terminal for a run. The CLI catches ConversionError at
 * the top level, prints the message and exits with status 1.
 */

#include <stdexcept>
#include <string>

namespace pixschem {

class ConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Palette directory or a requested palette source file does not exist
class PaletteSourceMissing : public ConversionError {
public:
    using ConversionError::ConversionError;
};

/// PaletteIndex::load() finished with no entries
class EmptyPaletteError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

/// No usable block mapping survived parsing of all palette sources
class BlockMappingParseError : public EmptyPaletteError {
public:
    using EmptyPaletteError::EmptyPaletteError;
};

/// Input image unreadable, unsupported, or without pixels
class ImageDecodeError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

/// Failure persisting the schematic
class WriteError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

/// Grid cannot be stored as a schematic: an extent over 32767 or a cell
/// without a palette entry
class InvalidGridError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

/// Bytes are not a schematic this library can read back
class SchematicFormatError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

}  // namespace pixschem
