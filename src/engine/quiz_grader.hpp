#ifndef XPECONOMY_ENGINE_QUIZ_GRADER_HPP
#define XPECONOMY_ENGINE_QUIZ_GRADER_HPP

#include <string>
#include <vector>
#include <future>
#include <cstdint>

namespace xpeconomy {
namespace engine {

struct QuizSubmission
{
    std::string accountId;
    std::string contentId;
    std::vector<std::string> answers;
    int64_t wpmUsed = 0;
    std::string requestKey;
};

struct QuizGrade
{
    int64_t scorePct = 0;
    int64_t wpmUsed = 0;
};

/**
 * @class IQuizGrader
 * @brief Asynchronous grading service. The returned future may never become
 *        ready; callers wait on it with a timeout and must not block on its
 *        destruction, so implementations should not hand out std::async futures.
 */
class IQuizGrader
{
public:
    virtual ~IQuizGrader() = default;
    virtual std::future<QuizGrade> Grade(const QuizSubmission &submission) = 0;
};

} // namespace engine
} // namespace xpeconomy

#endif // XPECONOMY_ENGINE_QUIZ_GRADER_HPP
