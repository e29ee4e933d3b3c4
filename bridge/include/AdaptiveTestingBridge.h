#pragma once

#ifdef __cplusplus
extern "C" {
#endif

char *adapt_start_session(const char *request_json);
char *adapt_submit_response(const char *session_id, const char *response_json);
char *adapt_mark_for_review(const char *session_id);
char *adapt_session_status(const char *session_id);
char *adapt_finish_session(const char *session_id);
int adapt_active_session_count(void);
void adapt_free_string(char *ptr);

#ifdef __cplusplus
}
#endif
