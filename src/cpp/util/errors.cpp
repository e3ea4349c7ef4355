#include <syncdl/util/errors.h>

namespace syncdl {

    std::string describe_exception(const std::exception_ptr &error) {
        if (!error) { return "no error"; }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &e) {
            return e.what();
        } catch (const std::string &s) {
            return s;
        } catch (const char *s) {
            return s;
        } catch (...) {
            return "unknown error";
        }
    }

} // namespace syncdl
