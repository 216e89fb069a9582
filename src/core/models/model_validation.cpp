#include "token_keeper/core/models.hpp"
#include "token_keeper/utils/config_validator.hpp"

namespace token_keeper {
namespace core {

bool ApplicationConfig::is_valid() const {
    return utils::ConfigValidator::validate_application_config(*this).is_valid;
}

} // namespace core
} // namespace token_keeper
