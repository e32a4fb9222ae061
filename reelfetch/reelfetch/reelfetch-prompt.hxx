#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <istream>
#include <ostream>
#include <optional>

#include <reelfetch/fallback/fallback-types.hxx>

namespace reelfetch
{
  // Fallback operator asking at the terminal.
  //
  // Answers are read line by line. An unrecognized answer repeats the
  // question. If the input is closed we bail out with ios_base::failure
  // rather than guess.
  //
  class console_operator: public fallback_operator
  {
  public:
    console_operator (std::istream&, std::ostream&);

    fallback_mode
    choose_mode (const std::vector<fallback_item>&) override;

    std::optional<std::size_t>
    choose_candidate (const fallback_item&,
                      const std::vector<fallback_choice>&) override;

  private:
    std::string
    ask (const std::string& prompt);

  private:
    std::istream& is_;
    std::ostream& os_;
  };

  // Parse the --fallback value: ask, auto, manual, or skip. Return nullopt
  // for ask. Throw invalid_argument on anything else.
  //
  std::optional<fallback_mode>
  to_fallback_mode (const std::string&);
}
