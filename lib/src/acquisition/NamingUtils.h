#pragma once

#include <string>
#include <utility>

namespace podsync {

/**
 * Split a display title into (artist, title).
 * Tries "Artist - Title", "Artist: Title" and "Artist | Title" in that order;
 * without a separator the artist is empty and the title is the trimmed input.
 */
std::pair<std::string, std::string> SplitArtistTitle(const std::string& display_title);

/// Replace <>:"/\|?* with '_' and cap at 100 characters (97 + "...")
std::string SanitizeFilename(const std::string& name);

/// True when the reference carries a list=<id> parameter
bool IsCollectionReference(const std::string& reference);

/// The <id> of list=<id>, or empty
std::string ExtractCollectionId(const std::string& reference);

/// Two-digit ordinal prefix ("01", "02", ... "100")
std::string FormatOrdinal(int ordinal);

} // namespace podsync
