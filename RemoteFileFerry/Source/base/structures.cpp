// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "structures.h"

using namespace ferry;
using namespace rff;


std::wstring rff::getFilterLabel(const FilterCriteria& filter)
{
    struct LabelVisitor
    {
        std::wstring operator()(const FilterAll&) const { return _("All files"); }

        std::wstring operator()(const FilterPattern& f) const { return _("File name pattern:") + L' ' + utfTo<std::wstring>(f.pattern); }

        std::wstring operator()(const FilterExtension& f) const
        {
            std::wstring exts;
            for (const std::string& ext : f.extensions)
                exts += (exts.empty() ? L"" : L", ") + utfTo<std::wstring>(ext);
            return _("File extensions:") + L' ' + exts;
        }

        std::wstring operator()(const FilterModTime& f) const
        {
            std::wstring tokens;
            for (const std::string& token : f.timeTokens)
                tokens += (tokens.empty() ? L"" : L" - ") + utfTo<std::wstring>(token);
            return _("Modification time:") + L' ' + tokens;
        }
    };
    return std::visit(LabelVisitor(), filter);
}


std::wstring rff::getCollisionPolicyLabel(CollisionPolicy policy)
{
    switch (policy)
    {
        case CollisionPolicy::skip:
            return _("Skip existing files");
        case CollisionPolicy::overwrite:
            return _("Overwrite existing files");
        case CollisionPolicy::rename:
            return _("Rename with time stamp");
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


std::optional<CollisionPolicy> rff::parseCollisionPolicy(std::string_view name)
{
    name = trimCpy(name);
    if (equalAsciiNoCase(name, "skip"))
        return CollisionPolicy::skip;
    if (equalAsciiNoCase(name, "overwrite"))
        return CollisionPolicy::overwrite;
    if (equalAsciiNoCase(name, "rename"))
        return CollisionPolicy::rename;
    return {};
}


bool rff::isArchivingActive(const ServerConfig& sourceCfg)
{
    return sourceCfg.archiveEnabled && !trimCpy(sourceCfg.backupDir).empty();
}
