#pragma once

namespace utils::verbose {
/**
 * @class Flags
 * @brief Controls verbosity flags for printing classification traces.
 *
 * Use the provided setter methods to enable specific flags and the Active()
 * method to check if any flags are active. Very verbose output implies
 * verbose output.
 */
class Flags {
private:
  /**
   * @brief Default constructor.
   */
  Flags() = default;

  Flags(const Flags &other) = delete;
  Flags &operator=(const Flags &other) = delete;

public:
  /**
   * @brief Check if the flag to print verbose information is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintVerbose() const;

  /**
   * @brief Check if the flag to print the label map after every stage is
   * active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintVeryVerbose() const;

  /**
   * @brief Check if any verbosity flags are active.
   * @return True if any flag is active, false otherwise.
   */
  bool Active() const;

  /**
   * @brief Turn all verbosity flags off.
   */
  void Clean();

  /**
   * @brief Set the flag to print verbose information.
   */
  void SetNeedToPrintVerbose();

  /**
   * @brief Set the flag to print the label map after every stage.
   */
  void SetNeedToPrintVeryVerbose();

  static Flags &getInstance() {
    static Flags instance;
    return instance;
  }

private:
  bool need_to_print_verbose_ = false;
  bool need_to_print_very_verbose_ = false;
};

} // namespace utils::verbose
