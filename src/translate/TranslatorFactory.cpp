#include "ITranslator.hpp"
#include "OpenAITranslator.hpp"
#include "DashscopeTranslator.hpp"

#include <memory>

namespace translate
{
std::unique_ptr<ITranslator> createTranslator(Backend backend, std::unique_ptr<HttpTransport> transport)
{
    switch (backend)
    {
    case Backend::OpenAI:
        return std::make_unique<OpenAITranslator>(std::move(transport));
    case Backend::Dashscope:
        return std::make_unique<DashscopeTranslator>(std::move(transport));
    default:
        return nullptr;
    }
}
} // namespace translate
