// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_filter.h"
#include "time_expr.h"
#include <algorithm>

using namespace ferry;
using namespace rff;


namespace
{
bool matchesMask(const char* name, const char* const nameEnd, const char* mask /*0-terminated*/)
{
    for (;; ++mask, ++name)
    {
        char m = *mask;
        switch (m)
        {
            case 0:
                return name == nameEnd;

            case '?':
                if (name == nameEnd)
                    return false;
                break;

            case '*':
                do //advance mask to next non-* char
                {
                    m = *++mask;
                }
                while (m == '*');

                if (m == 0) //mask ends with '*':
                    return true;

                ++mask;
                if (m == '?') //*? pattern
                {
                    while (name != nameEnd)
                        if (matchesMask(++name, nameEnd, mask))
                            return true;
                }
                else //*[letter] pattern
                    while (name != nameEnd)
                        if (*name++ == m)
                            if (matchesMask(name, nameEnd, mask))
                                return true;
                return false;

            default:
                if (name == nameEnd || *name != m)
                    return false;
        }
    }
}


std::string asciiToLowerCpy(std::string_view str)
{
    std::string output(str);
    for (char& c : output)
        c = asciiToLower(c);
    return output;
}


struct CriteriaVisitor
{
    void operator()(const FilterAll&) const {}

    void operator()(const FilterPattern& fp) const //throw InvalidFilterCriteria
    {
        if (trimCpy(fp.pattern).empty())
            throw InvalidFilterCriteria(_("Invalid filter settings:") + L' ' + _("The file name pattern is empty."));
        if (contains(fp.pattern, '\0'))
            throw InvalidFilterCriteria(_("Invalid filter settings:") + L' ' + _("The file name pattern contains a null character."));
    }

    void operator()(const FilterExtension& fe) const //throw InvalidFilterCriteria
    {
        if (fe.extensions.empty())
            throw InvalidFilterCriteria(_("Invalid filter settings:") + L' ' + _("The extension list is empty."));

        for (const std::string& ext : fe.extensions)
        {
            std::string_view extTrm = trimCpy(std::string_view(ext));
            if (startsWith(extTrm, '.'))
                extTrm.remove_prefix(1);
            if (extTrm.empty())
                throw InvalidFilterCriteria(_("Invalid filter settings:") + L' ' + replaceCpy(_("Invalid file extension %x."), L"%x", fmtPath(utfTo<std::wstring>(ext))));
        }
    }

    void operator()(const FilterModTime& fm) const //throw InvalidFilterCriteria
    {
        if (fm.timeTokens.empty() || fm.timeTokens.size() > 2)
            throw InvalidFilterCriteria(_("Invalid filter settings:") + L' ' +
                                        replaceCpy(_("Expected one or two time expressions, got %x."), L"%x", numberTo<std::wstring>(fm.timeTokens.size())));
    }
};
}


FileFilter::FileFilter(const FilterCriteria& criteria, time_t now) //throw InvalidFilterCriteria
{
    std::visit(CriteriaVisitor(), criteria); //throw InvalidFilterCriteria

    if (std::get_if<FilterAll>(&criteria))
        type_ = FilterType::all;

    else if (const auto fp = std::get_if<FilterPattern>(&criteria))
    {
        type_ = FilterType::pattern;
        pattern_ = fp->pattern;
    }
    else if (const auto fe = std::get_if<FilterExtension>(&criteria))
    {
        type_ = FilterType::extension;
        for (const std::string& ext : fe->extensions)
        {
            std::string_view extTrm = trimCpy(std::string_view(ext));
            if (startsWith(extTrm, '.'))
                extTrm.remove_prefix(1);

            extensions_.push_back(asciiToLowerCpy(extTrm));
        }
        std::sort(extensions_.begin(), extensions_.end());
        extensions_.erase(std::unique(extensions_.begin(), extensions_.end()), extensions_.end());
    }
    else if (const auto fm = std::get_if<FilterModTime>(&criteria))
    {
        type_ = FilterType::modTime;

        std::vector<time_t> resolved;
        for (const std::string& token : fm->timeTokens)
            try
            {
                resolved.push_back(resolveTimeExpression(token, now)); //throw InvalidTimeExpression
            }
            catch (const InvalidTimeExpression& e)
            {
                throw InvalidFilterCriteria(_("Invalid filter settings:") + L' ' + _("Cannot resolve the modification time window."), e.toString());
            }

        if (resolved.size() == 1)
            timeFrom_ = resolved[0];
        else
        {
            //window is order-independent
            timeFrom_ = std::min(resolved[0], resolved[1]);
            timeTo_   = std::max(resolved[0], resolved[1]);
            timeToBounded_ = true;
        }
    }
    else
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


bool FileFilter::passFilter(const FileEntry& entry) const
{
    switch (type_)
    {
        case FilterType::all:
            return true;

        case FilterType::pattern:
            return matchesWildcardPattern(entry.name, pattern_);

        case FilterType::extension:
            if (const std::optional<std::string> ext = getFileExtension(entry.name))
                return std::binary_search(extensions_.begin(), extensions_.end(), asciiToLowerCpy(*ext));
            return false;

        case FilterType::modTime:
            return timeFrom_ <= entry.modTime &&
                   (!timeToBounded_ || entry.modTime <= timeTo_);
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


std::vector<FileEntry> FileFilter::select(const std::vector<FileEntry>& entries) const
{
    std::vector<FileEntry> output;
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(output), [&](const FileEntry& entry) { return passFilter(entry); });
    return output;
}


bool rff::matchesWildcardPattern(std::string_view name, std::string_view pattern)
{
    const std::string mask(pattern); //0-terminated
    return matchesMask(name.data(), name.data() + name.size(), mask.c_str());
}


std::optional<std::string> rff::getFileExtension(std::string_view name)
{
    const size_t pos = name.rfind('.');
    if (pos == std::string_view::npos || pos == 0) //".profile"
        return {};
    return std::string(name.substr(pos + 1)); //"file." => ""
}
