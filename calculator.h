#ifndef CALCULATOR_H
#define CALCULATOR_H
// C Interface to calculator library

#include "calculator_export.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct calc_expression_t calc_expression_t;

typedef enum calc_status_t {
    CALC_OK = 0,
    CALC_SYNTAX_ERROR,
    CALC_UNSUPPORTED_EXPRESSION,
    CALC_DIVISION_BY_ZERO,
    CALC_DOMAIN_ERROR,
    CALC_OVERFLOW_ERROR,
    CALC_INTERNAL_ERROR
} calc_status_t;

CALCULATOR_EXPORT const calc_expression_t* calc_expression(const char* exp);
CALCULATOR_EXPORT void calc_expression_free(const calc_expression_t* exp);
CALCULATOR_EXPORT calc_status_t calc_expression_eval(const calc_expression_t* exp, double* result);
CALCULATOR_EXPORT void calc_expression_dump(const calc_expression_t* exp);

CALCULATOR_EXPORT calc_status_t calc_evaluate(const char* exp, double* result);
CALCULATOR_EXPORT const char* calc_status_message(calc_status_t status);

#ifdef __cplusplus
};
#endif

#endif
