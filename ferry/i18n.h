// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef I18N_H_2214097735910385264
#define I18N_H_2214097735910385264

#include <memory>
#include <mutex>
#include <string>


//minimal layer marking user-visible text for translation

#define FERRY_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s) ferry::translate(FERRY_TRANS_CONCAT_SUB(L, s))

namespace ferry
{
struct TranslationHandler
{
    TranslationHandler() {}
    virtual ~TranslationHandler() {}

    //"const" member must be thread-safe
    virtual std::wstring translate(const std::wstring& text) const = 0;

private:
    TranslationHandler           (const TranslationHandler&) = delete;
    TranslationHandler& operator=(const TranslationHandler&) = delete;
};

void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler); //take ownership
std::shared_ptr<const TranslationHandler> getTranslator();

std::wstring translate(const std::wstring& text);







//######################## implementation ##############################
namespace impl
{
inline std::mutex globalTranslationLock;
inline std::shared_ptr<const TranslationHandler> globalTranslationHandler;
}

inline
void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler)
{
    std::lock_guard dummy(impl::globalTranslationLock);
    impl::globalTranslationHandler = std::move(newHandler);
}


inline
std::shared_ptr<const TranslationHandler> getTranslator()
{
    std::lock_guard dummy(impl::globalTranslationLock);
    return impl::globalTranslationHandler;
}


inline
std::wstring translate(const std::wstring& text)
{
    if (std::shared_ptr<const TranslationHandler> t = getTranslator()) //std::shared_ptr => temporarily take (shared) ownership!
        return t->translate(text);
    return text;
}
}

#endif //I18N_H_2214097735910385264
