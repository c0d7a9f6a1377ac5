#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "CsrfTypes.hpp"
#include "Signer.hpp"

class CValidator {
  public:
    explicit CValidator(std::shared_ptr<const CSigner> signer);

    // raw value of a well-formed, correctly signed token. The error is for logs only.
    std::expected<std::string, eTokenError> verify(std::string_view token) const;

    // same, collapsed: anything wrong is just nullopt
    std::optional<std::string>              extractRaw(std::string_view token) const;

    // both tokens valid and carrying the same raw value
    bool                                    tokensMatch(std::string_view a, std::string_view b) const;

    // raw values of two already verified tokens, in constant time
    static bool                             rawEquals(std::string_view a, std::string_view b);

  private:
    std::shared_ptr<const CSigner>          m_signer;
};
