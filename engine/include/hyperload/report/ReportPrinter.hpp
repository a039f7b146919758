#pragma once

#include <hyperload/RunConfig.hpp>
#include <hyperload/stats/Summary.hpp>

#include <ostream>

namespace hyperload::report
{

/// 실행 시작 배너 (대상, 프로토콜, 동시성, 작업 수, 선택 옵션)
void printBanner(std::ostream &os, const RunConfig &config);

/// 결과 블록 (처리량, 지연 분포, 상태 코드, 오류 상세)
void printReport(std::ostream &os, const RunConfig &config, const stats::Summary &summary);

} // namespace hyperload::report
