#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace suid {

constexpr const char* LOGGER_NAME = "suid";

/**
 * 라이브러리 로거 반환
 * 처음 호출 시 "suid" 이름으로 등록된 로거를 재사용하거나
 * 없으면 stderr 컬러 로거를 생성한다.
 * @return 로거
 */
std::shared_ptr<spdlog::logger> GetLogger();

/**
 * 라이브러리 로거 교체
 * 애플리케이션 싱크로 보내거나 null 싱크로 끌 때 사용한다.
 * @param logger 새 로거 (nullptr이면 기본 로거로 복원)
 */
void SetLogger(std::shared_ptr<spdlog::logger> logger);

} // namespace suid
