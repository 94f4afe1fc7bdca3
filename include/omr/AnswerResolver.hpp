#ifndef OMR_ANSWER_RESOLVER_HPP
#define OMR_ANSWER_RESOLVER_HPP

#include "omr/FillClassifier.hpp"
#include "omr/Types.hpp"

#include <vector>

namespace omr {

class AnswerResolver {
public:
    explicit AnswerResolver(double fillThreshold);

    // fillDetails is kept only when debug is set.
    ResolvedAnswers resolve(const std::vector<Row>& rows, const BinaryMask& mask, bool debug) const;

private:
    FillClassifier classifier_;
};

}

#endif
