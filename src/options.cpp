#include <parafetch/options.hpp>

namespace parafetch
{
    std::string cookie_header_value(const std::vector<Cookie>& cookies)
    {
        std::string res;
        for (const auto& cookie : cookies)
        {
            if (cookie.name.empty())
            {
                continue;
            }
            if (!res.empty())
            {
                res += "; ";
            }
            res += cookie.name + "=" + cookie.value;
        }
        return res;
    }
}
