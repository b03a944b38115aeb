// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_FILTER_H_5520938741160427385
#define FILE_FILTER_H_5520938741160427385

#include "structures.h"


namespace rff
{
DEFINE_NEW_FILE_ERROR(InvalidFilterCriteria)

/*  file selection for one run:
    - criteria are validated and time tokens resolved *once* during construction => no I/O before a bad configuration is reported
    - matching is against the file name only, never the path                                                                    */
class FileFilter
{
public:
    FileFilter(const FilterCriteria& criteria, time_t now); //throw InvalidFilterCriteria

    bool passFilter(const FileEntry& entry) const;

    //subset in listing order
    std::vector<FileEntry> select(const std::vector<FileEntry>& entries) const;

    //resolved modification time window (modification_time only)
    time_t getTimeFrom() const { return timeFrom_; }
    time_t getTimeTo  () const { return timeTo_; }

private:
    enum class FilterType
    {
        all,
        pattern,
        extension,
        modTime,
    };

    FilterType type_ = FilterType::all;
    std::string pattern_;
    std::vector<std::string> extensions_; //lower-case, without '.'
    time_t timeFrom_ = 0;
    time_t timeTo_   = 0;
    bool   timeToBounded_ = false;
};


bool matchesWildcardPattern(std::string_view name, std::string_view pattern); //'*': any run of chars, '?': exactly one char; anchored
std::optional<std::string> getFileExtension(std::string_view name); //no '.', or leading '.' only: no extension
}

#endif //FILE_FILTER_H_5520938741160427385
